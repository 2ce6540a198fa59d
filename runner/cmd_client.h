#pragma once

// Client subcommands. They talk to a running `serve` only through the data
// root: requests go into spool/, state is read from the job store and the
// job directories.
int cmd_submit(int argc, char** argv);
int cmd_resubmit(int argc, char** argv);
int cmd_status(int argc, char** argv);
int cmd_list(int argc, char** argv);
int cmd_artifact(int argc, char** argv);
int cmd_output(int argc, char** argv);

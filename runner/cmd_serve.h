#pragma once

// sheetrun_cli serve: runs the supervisor until SIGINT/SIGTERM.
int cmd_serve(int argc, char** argv);

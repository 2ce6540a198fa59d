#include "test_common.h"

#include "sheetrun/events.h"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <set>

#include <sys/wait.h>
#include <unistd.h>

using namespace sheetrun;

int main() {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "sheetrun_test_events";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);
    const fs::path path = dir / "events.ndjson";

    // Supervisor and child take turns, each with a fresh EventLog; the
    // sequence continues across writers.
    {
        EventLog sup(path, "job1", EventSource::Supervisor);
        expect_true(sup.append("job.queued", "queued").empty(), "append queued");
        expect_true(sup.append("job.started", "running").empty(), "append started");
    }
    {
        EventLog child(path, "job1", EventSource::Child);
        expect_true(child.append("stage.started", "", "detect_table").empty(), "append stage");
        expect_true(child.append("pipeline.completed").empty(), "append pipeline");
    }
    // A torn line from a killed writer is ignored, not fatal.
    {
        std::ofstream f(path, std::ios::app);
        f << "{\"seq\":99,\"event\":\"half";
    }
    {
        EventLog sup(path, "job1", EventSource::Supervisor);
        // the torn fragment has no newline, so the next record must start on its own line
        std::ofstream f(path, std::ios::app);
        f << "\n";
        f.close();
        expect_true(sup.append(kEventJobSuccess, "success").empty(), "append terminal");
    }

    auto events = read_events(path);
    expect_eq_ll((long long)events.size(), 5, "five complete events");
    for (size_t i = 0; i < events.size(); i++) {
        expect_eq_ll(events[i].seq, (long long)i + 1, "seq is contiguous");
        expect_true(events[i].job_id == "job1", "job id on every record");
        expect_true(!events[i].ts.empty(), "timestamp on every record");
    }
    expect_true(events[0].source == "supervisor", "first record from supervisor");
    expect_true(events[2].source == "child" && events[2].detail == "detect_table", "child stage record");
    expect_true(events[4].event == kEventJobSuccess && events[4].state == "success", "terminal record");

    auto terms = terminal_events(events);
    expect_eq_ll((long long)terms.size(), 1, "exactly one terminal event");

    // Writers opened before either appends still share the sequence.
    {
        const fs::path p2 = dir / "overlap.ndjson";
        EventLog sup(p2, "job2", EventSource::Supervisor);
        EventLog child(p2, "job2", EventSource::Child);
        expect_true(sup.append("child.spawned").empty(), "supervisor append");
        expect_true(child.append("stage.started").empty(), "child append");
        expect_true(sup.append(kEventJobError, "error").empty(), "supervisor terminal");
        auto ev = read_events(p2);
        expect_eq_ll((long long)ev.size(), 3, "three events");
        for (size_t i = 0; i < ev.size(); i++) expect_eq_ll(ev[i].seq, (long long)i + 1, "overlapping writers");
    }

    // Two processes appending at the same time never reuse a seq.
    {
        const fs::path p3 = dir / "race.ndjson";
        const int per_writer = 100;
        pid_t pid = fork();
        if (pid == 0) {
            EventLog child(p3, "job3", EventSource::Child);
            for (int i = 0; i < per_writer; i++) {
                if (!child.append("stage.started").empty()) _exit(1);
            }
            _exit(0);
        }
        expect_true(pid > 0, "fork");
        EventLog sup(p3, "job3", EventSource::Supervisor);
        for (int i = 0; i < per_writer; i++) {
            expect_true(sup.append("child.spawned").empty(), "supervisor append under race");
        }
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        expect_true(WIFEXITED(status) && WEXITSTATUS(status) == 0, "child writer succeeded");

        auto ev = read_events(p3);
        expect_eq_ll((long long)ev.size(), 2 * per_writer, "every append landed");
        std::set<int64_t> seen;
        int64_t prev = 0;
        for (const auto& e : ev) {
            expect_true(e.seq > prev, "seq increases in file order");
            prev = e.seq;
            seen.insert(e.seq);
        }
        expect_eq_ll((long long)seen.size(), 2 * per_writer, "no seq reused");
    }

    fs::remove_all(dir, ec);
    std::cerr << "test_events: ALL PASSED" << std::endl;
    return 0;
}

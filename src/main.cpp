#include <iostream>
#include <string>
#include <vector>
#include "queue_cmd.hpp"
#include "worker_cmd.hpp"
#include "config_cmd.hpp"

static void print_usage() {
    std::cout << "Usage: queuectl <command> [options]\n\n"
              << "A simple CLI-based background job queue system.\n\n"
              << "Commands:\n"
              << "  init-db                     Initialize the job queue database\n"
              << "  enqueue JOB_SPEC_JSON       Add a new job, e.g.\n"
              << "                              '{\"id\":\"job1\",\"command\":\"echo hello\"}'\n"
              << "  worker start [--count N]    Start N worker processes in the background\n"
              << "  worker stop                 Stop all running workers gracefully\n"
              << "  status                      Show job counts per state and active workers\n"
              << "  list [--state STATE]        List jobs, optionally filtered by state\n"
              << "  dlq list                    View all jobs in the Dead Letter Queue\n"
              << "  dlq retry JOB_ID            Move a job from the DLQ back to pending\n"
              << "  config set KEY VALUE        Set max_retries / backoff_base_seconds\n"
              << "  config get KEY              Show a configuration value\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string cmd = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        args.push_back(argv[i]);
    }

    if (cmd == "init-db") {
        return queuectl::cmd_init_db();
    }
    else if (cmd == "enqueue") {
        return queuectl::cmd_enqueue(args);
    }
    else if (cmd == "worker") {
        return queuectl::cmd_worker(args);
    }
    else if (cmd == "status") {
        return queuectl::cmd_status();
    }
    else if (cmd == "list") {
        return queuectl::cmd_list(args);
    }
    else if (cmd == "dlq") {
        return queuectl::cmd_dlq(args);
    }
    else if (cmd == "config") {
        return queuectl::cmd_config(args);
    }
    else if (cmd == "-h" || cmd == "--help" || cmd == "help") {
        print_usage();
        return 0;
    }
    else {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage();
        return 1;
    }
}

// Deterministic UCI engine used by the test suites. Behaviour is chosen with
// command line flags; see parse_options.
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

struct Options {
    std::string name = "Stub";
    std::string bestmove = "e2e4";
    std::string white_move;
    std::string black_move;
    std::vector<std::string> info_lines;
    std::string track_dir;
    std::string hang_once_marker;
    std::string late_bestmove;
    int late_ms = 0;
    int delay_ms = 0;
    bool no_uciok = false;
    bool exit_after_uci = false;
    bool crash_on_go = false;
    bool hang_on_go = false;
    bool slow_stop = false;
    bool ignore_quit = false;
};

char g_track_file[4096] = {0};

void remove_track_file() {
    if (g_track_file[0] != '\0') {
        unlink(g_track_file);
        g_track_file[0] = '\0';
    }
}

void on_sigterm(int) {
    if (g_track_file[0] != '\0') {
        unlink(g_track_file);
    }
    _exit(0);
}

Options parse_options(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string { return i + 1 < argc ? argv[++i] : ""; };
        if (arg == "--name") {
            options.name = next();
        } else if (arg == "--bestmove") {
            options.bestmove = next();
        } else if (arg == "--side-moves") {
            std::string moves = next();
            auto comma = moves.find(',');
            options.white_move = moves.substr(0, comma);
            options.black_move = comma == std::string::npos ? "" : moves.substr(comma + 1);
        } else if (arg == "--info") {
            options.info_lines.push_back(next());
        } else if (arg == "--track") {
            options.track_dir = next();
        } else if (arg == "--hang-once") {
            options.hang_once_marker = next();
        } else if (arg == "--late-bestmove") {
            options.late_bestmove = next();
            options.late_ms = std::stoi(next());
        } else if (arg == "--delay-ms") {
            options.delay_ms = std::stoi(next());
        } else if (arg == "--no-uciok") {
            options.no_uciok = true;
        } else if (arg == "--exit-after-uci") {
            options.exit_after_uci = true;
        } else if (arg == "--crash-on-go") {
            options.crash_on_go = true;
        } else if (arg == "--hang-on-go") {
            options.hang_on_go = true;
        } else if (arg == "--slow-stop") {
            options.slow_stop = true;
        } else if (arg == "--ignore-quit") {
            options.ignore_quit = true;
        }
    }
    return options;
}

// Records this process in `dir`; the file content is the number of other
// stub processes that were alive at startup.
void register_instance(const std::string& dir) {
    namespace fs = std::filesystem;
    int others = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file()) {
            ++others;
        }
    }
    const auto path = (fs::path(dir) / std::to_string(getpid())).string();
    std::ofstream(path) << others;
    std::snprintf(g_track_file, sizeof(g_track_file), "%s", path.c_str());
}

std::mutex g_output_mutex;

void send(const std::string& line) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << line << std::endl;
}

void hang_forever() {
    while (true) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
}

} // namespace

int main(int argc, char* argv[]) {
    Options options = parse_options(argc, argv);
    std::signal(SIGTERM, on_sigterm);

    if (!options.track_dir.empty()) {
        register_instance(options.track_dir);
    }

    bool black_to_move = false;
    bool searching = false;
    bool late_pending = !options.late_bestmove.empty();
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line == "uci") {
            if (options.exit_after_uci) {
                break;
            }
            send("id name " + options.name);
            send("id author chessan tests");
            send("option name Hash type spin default 16 min 1 max 1024");
            send("option name Threads type spin default 1 min 1 max 64");
            if (!options.no_uciok) {
                send("uciok");
            }
        } else if (line == "isready") {
            send("readyok");
        } else if (line.rfind("position fen ", 0) == 0) {
            std::istringstream fields(line.substr(13));
            std::string placement, side;
            fields >> placement >> side;
            black_to_move = side == "b";
        } else if (line.rfind("go", 0) == 0) {
            if (options.crash_on_go) {
                break;
            }
            if (options.hang_on_go) {
                hang_forever();
            }
            if (!options.hang_once_marker.empty() &&
                !std::filesystem::exists(options.hang_once_marker)) {
                std::ofstream(options.hang_once_marker) << "hung";
                hang_forever();
            }
            // First search answers long after any stop; the loop keeps
            // serving isready meanwhile.
            if (late_pending) {
                late_pending = false;
                std::thread([move = options.late_bestmove, delay = options.late_ms] {
                    std::this_thread::sleep_for(std::chrono::milliseconds(delay));
                    send("bestmove " + move);
                }).detach();
                continue;
            }
            if (options.slow_stop) {
                searching = true;
                continue;
            }
            if (options.delay_ms > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(options.delay_ms));
            }
            for (const auto& info : options.info_lines) {
                send("info " + info);
            }
            std::string move = options.bestmove;
            if (!options.white_move.empty()) {
                move = black_to_move ? options.black_move : options.white_move;
            }
            send(move == "none" ? "bestmove (none)" : "bestmove " + move);
        } else if (line == "stop") {
            if (searching) {
                searching = false;
                send("bestmove " + options.bestmove);
            }
        } else if (line == "quit") {
            if (!options.ignore_quit) {
                break;
            }
        }
    }

    remove_track_file();
    return 0;
}

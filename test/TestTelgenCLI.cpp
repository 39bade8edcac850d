#include <cassert>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

static std::string find_telgen_bin() {
    if (const char* env = std::getenv("TELGEN_BIN")) {
        if (env[0] != '\0' && fs::exists(env)) {
            return fs::absolute(env).string();
        }
    }
#ifdef TELGEN_BIN_PATH
    if (fs::exists(TELGEN_BIN_PATH)) {
        return TELGEN_BIN_PATH;
    }
#endif

    std::vector<std::string> candidates = {
        "./telgen",
        "../telgen",
        "./build/telgen",
        "../build/telgen"
    };

    for (const auto& c : candidates) {
        if (fs::exists(c)) {
            return fs::absolute(fs::path(c)).string();
        }
    }

    return {};
}

static std::string find_project_root() {
    if (const char* env = std::getenv("TELGEN_ROOT")) {
        if (env[0] != '\0' && fs::exists(fs::path(env) / "src/telgen.cpp")) {
            return env;
        }
    }
#ifdef TELGEN_ROOT_PATH
    if (fs::exists(fs::path(TELGEN_ROOT_PATH) / "src/telgen.cpp")) {
        return TELGEN_ROOT_PATH;
    }
#endif

    fs::path p = fs::current_path();
    for (int i = 0; i < 6; ++i) {
        if (fs::exists(p / "src/telgen.cpp")) {
            return p.string();
        }
        if (p.has_parent_path()) {
            p = p.parent_path();
        } else {
            break;
        }
    }
    return {};
}

static int run_cmd(const std::string& cmd) {
    std::cout << "[RUN] " << cmd << std::endl;
    int status = std::system(cmd.c_str());
    if (status == -1 || !WIFEXITED(status)) {
        return -1;
    }
    return WEXITSTATUS(status);
}

static fs::path scratch_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("telgen_cli_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

static size_t count_lines(const fs::path& file) {
    std::ifstream in(file);
    std::string line;
    size_t lines = 0;
    while (std::getline(in, line)) ++lines;
    return lines;
}

void test_help_command() {
    const auto bin = find_telgen_bin();
    assert(!bin.empty() && "telgen binary not found; set TELGEN_BIN");

    int rc = run_cmd("\"" + bin + "\" --help");
    (void)rc;
    assert(rc == 0 && "telgen --help should exit 0");
    std::cout << "test_help_command passed\n";
}

void test_config_command() {
    const auto bin = find_telgen_bin();
    assert(!bin.empty() && "telgen binary not found; set TELGEN_BIN");

    const auto root = find_project_root();
    assert(!root.empty() && "project root not found; set TELGEN_ROOT");

    const fs::path work = scratch_dir("config");
    const std::string cfg = (fs::path(root) / "conf/lab.yaml").string();
    const std::string out = (work / "out").string();
    const std::string cmd = "cd \"" + work.string() + "\" && \"" + bin + "\" -v -c \"" + cfg + "\" -o \"" + out + "\"";
    int rc = run_cmd(cmd);
    (void)rc;
    assert(rc == 0 && "telgen -c <root>/conf/lab.yaml should exit 0");

    for (const char* name : {"grpc_data", "snmp_data", "syslog_data", "ddm_data", "predict_data"}) {
        fs::path file = fs::path(out) / (std::string(name) + ".csv");
        assert(fs::exists(file));
        // header plus 1000 rows
        assert(count_lines(file) == 1001);
    }
    assert(fs::exists(work / "log" / "telgen.log"));
    fs::remove_all(work);
    std::cout << "test_config_command passed\n";
}

void test_options_override_config() {
    const auto bin = find_telgen_bin();
    const auto root = find_project_root();
    assert(!bin.empty() && !root.empty());

    const fs::path work = scratch_dir("override");
    const std::string cfg = (fs::path(root) / "conf/lab.yaml").string();
    const std::string cmd = "cd \"" + work.string() + "\" && TELGEN_OUTPUT_DIR=\"" + (work / "env").string() +
                            "\" \"" + bin + "\" -c \"" + cfg + "\" -n 50 -t snmp,syslog -F jsonl -z gzip";
    int rc = run_cmd(cmd);
    (void)rc;
    assert(rc == 0);
    assert(fs::exists(work / "env" / "snmp_data.jsonl.gz"));
    assert(fs::exists(work / "env" / "syslog_data.jsonl.gz"));
    assert(!fs::exists(work / "env" / "grpc_data.jsonl.gz"));
    fs::remove_all(work);
    std::cout << "test_options_override_config passed\n";
}

void test_unknown_argument() {
    const auto bin = find_telgen_bin();
    assert(!bin.empty() && "telgen binary not found; set TELGEN_BIN");

    const fs::path work = scratch_dir("unknown");
    int rc = run_cmd("cd \"" + work.string() + "\" && \"" + bin + "\" --unknown-arg");
    (void)rc;
    assert(rc == 1 && "telgen with unknown args should exit 1");

    rc = run_cmd("cd \"" + work.string() + "\" && \"" + bin + "\" -f 2.5");
    assert(rc == 1 && "an out of range fault ratio is a configuration error");
    fs::remove_all(work);
    std::cout << "test_unknown_argument passed\n";
}

void test_sigterm_handling() {
    const auto bin = find_telgen_bin();
    assert(!bin.empty() && "telgen binary not found; set TELGEN_BIN");

    const fs::path work = scratch_dir("sigterm");
    const std::string out = (work / "out").string();

    pid_t pid = fork();
    if (pid == 0) {
        if (chdir(work.c_str()) != 0) {
            _exit(127);
        }
        execl(bin.c_str(), bin.c_str(), "-n", "5000000", "-E", "datacenter", "-S", "7",
              "-o", out.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    assert(pid > 0 && "fork failed");
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));
    int kill_rc = kill(pid, SIGTERM);
    (void)kill_rc;
    assert(kill_rc == 0 && "Failed to send SIGTERM");

    int status = 0;
    waitpid(pid, &status, 0);

    if (WIFSIGNALED(status)) {
        // Signal arrived before the handler was installed
        int sig = WTERMSIG(status);
        (void)sig;
        assert(sig == SIGTERM);
    } else if (WIFEXITED(status)) {
        assert(WEXITSTATUS(status) == 2 && "telgen should report partial output on SIGTERM");
    } else {
        assert(false && "Unexpected child status");
    }

    fs::remove_all(work);
    std::cout << "test_sigterm_handling passed\n";
}

int main() {
    test_help_command();
    test_config_command();
    test_options_override_config();
    test_unknown_argument();
    test_sigterm_handling();
    std::cout << "All telgen command tests passed\n";
    return 0;
}

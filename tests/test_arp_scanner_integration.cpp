#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/scanners/ArpScanner.h"
#include "../src/core/Errors.h"
#include "TestLogger.h"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

// Runs ArpScanner against a stand-in arp-scan shell script.
namespace arp_sweep {

using ::testing::HasSubstr;

class ArpScannerIntegrationTest : public ::testing::Test {
protected:
    std::string temp_dir;
    CapturingLogger log;

    void SetUp() override {
        char template_path[] = "/tmp/arp_scan_it_XXXXXX";
        char* dir = mkdtemp(template_path);
        ASSERT_NE(dir, nullptr);
        temp_dir = dir;
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir);
    }

    // Writes an executable fake arp-scan whose body is `body`. Its argv is
    // recorded one argument per line in args.txt.
    std::string create_fake_tool(const std::string& body) {
        std::string path = temp_dir + "/arp-scan";
        std::ofstream f(path);
        f << "#!/bin/sh\n"
          << "for a in \"$@\"; do printf '%s\\n' \"$a\"; done > '" << temp_dir << "/args.txt'\n"
          << body << "\n";
        f.close();
        chmod(path.c_str(), 0755);
        return path;
    }

    static bool process_alive(pid_t pid) {
        std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
        if (!stat) return false;
        std::string content; std::getline(stat, content);
        auto close_paren = content.rfind(')');
        if (close_paren == std::string::npos || close_paren + 2 >= content.size()) return false;
        return content[close_paren + 2] != 'Z';
    }

    std::string read_file(const std::string& name) {
        std::ifstream f(temp_dir + "/" + name);
        std::stringstream ss; ss << f.rdbuf(); return ss.str();
    }

    ArpScanner make_scanner(const std::string& binary, std::chrono::milliseconds grace = std::chrono::milliseconds(10000)) {
        ArpScannerOptions opts;
        opts.binary = binary;
        opts.watchdog_grace = grace;
        opts.kill_grace = std::chrono::milliseconds(500);
        return ArpScanner(log, default_process_runner(), opts);
    }
};

TEST_F(ArpScannerIntegrationTest, ParsesToolOutput) {
    auto tool = create_fake_tool(
        "printf '192.168.1.1\\t00:11:22:33:44:55\\tAcme Inc\\n'\n"
        "printf '192.168.1.2\\tAA-BB-CC-DD-EE-FF\\n'\n"
        "printf '\\n'\n"
        "printf '999.1.1.1\\t00:11:22:33:44:55\\tBogus\\n'\n"
        "exit 0");
    auto scanner = make_scanner(tool);
    auto devices = scanner.scan("eth0", "192.168.1.0/24", 2);

    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].ip, "192.168.1.1");
    EXPECT_EQ(devices[0].vendor, "Acme Inc");
    EXPECT_EQ(devices[1].mac, "aa-bb-cc-dd-ee-ff");
    EXPECT_EQ(devices[1].vendor, "Unknown");
    EXPECT_TRUE(log.contains(LogLevel::Warn, "Invalid device data: 999.1.1.1"));
}

TEST_F(ArpScannerIntegrationTest, PassesDocumentedArguments) {
    auto tool = create_fake_tool("exit 0");
    auto scanner = make_scanner(tool);
    EXPECT_TRUE(scanner.scan("enp3s0", "10.20.0.0/16", 3).empty());

    // The format template is one argument with literal tabs.
    EXPECT_EQ(read_file("args.txt"),
              "-I\nenp3s0\n-t\n3000\n--format\n${ip}\t${mac}\t${vendor}\n--plain\n--quiet\n10.20.0.0/16\n");
}

TEST_F(ArpScannerIntegrationTest, NonZeroExitReportsStderr) {
    auto tool = create_fake_tool("echo 'permission denied' 1>&2\nexit 1");
    auto scanner = make_scanner(tool);
    try {
        scanner.scan("eth0", "192.168.1.0/24", 1);
        FAIL() << "expected ExitError";
    } catch (const ExitError& e) {
        EXPECT_EQ(e.exit_code(), 1);
        EXPECT_THAT(e.what(), HasSubstr("exit code 1"));
        EXPECT_THAT(e.what(), HasSubstr("permission denied"));
    }
    EXPECT_FALSE(scanner.in_progress());
}

TEST_F(ArpScannerIntegrationTest, MissingToolIsSpawnError) {
    auto scanner = make_scanner(temp_dir + "/no-such-arp-scan");
    EXPECT_THROW(scanner.scan("eth0", "192.168.1.0/24", 1), SpawnError);
    EXPECT_FALSE(scanner.in_progress());
}

TEST_F(ArpScannerIntegrationTest, WatchdogKillsHungTool) {
    auto tool = create_fake_tool("echo $$ > '" + temp_dir + "/pid'\nexec sleep 60");
    auto scanner = make_scanner(tool, std::chrono::milliseconds(200));

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(scanner.scan("eth0", "192.168.1.0/24", 0.1), TimeoutError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
    EXPECT_FALSE(scanner.in_progress());

    std::ifstream pf(temp_dir + "/pid"); pid_t pid = -1; pf >> pid;
    ASSERT_GT(pid, 0);
    EXPECT_FALSE(process_alive(pid));
}

TEST_F(ArpScannerIntegrationTest, VersionProbe) {
    auto tool = create_fake_tool("if [ \"$1\" = \"--version\" ]; then echo 'arp-scan 1.10.0'; echo 'Copyright' 1>&2; exit 0; fi\nexit 1");
    auto version = ArpScanner::get_version(default_process_runner(), tool);
    EXPECT_THAT(version, HasSubstr("arp-scan 1.10.0"));
    EXPECT_THAT(version, HasSubstr("Copyright"));
}

TEST_F(ArpScannerIntegrationTest, VersionProbeFailure) {
    auto tool = create_fake_tool("exit 2");
    EXPECT_THROW(ArpScanner::get_version(default_process_runner(), tool), VersionError);
    EXPECT_THROW(ArpScanner::get_version(default_process_runner(), temp_dir + "/missing"), VersionError);
}

TEST_F(ArpScannerIntegrationTest, AvailabilityProbe) {
    auto tool = create_fake_tool("exit 0");
    EXPECT_TRUE(ArpScanner::check_availability(default_process_runner(), tool));
    EXPECT_FALSE(ArpScanner::check_availability(default_process_runner(), temp_dir + "/missing"));
}

} // namespace arp_sweep

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

#include <catch2/catch.hpp>
#include "process/subprocess.hpp"
#include <filesystem>
#include <fstream>

#include <fcntl.h>
#include <unistd.h>

using namespace mfnf;
namespace fs = std::filesystem;

TEST_CASE("run_process: Captures stdout", "[subprocess]") {
    ProcessOutput output = run_process("/bin/sh", {"-c", "printf 'hello'"});

    REQUIRE(output.stdout_bytes == "hello");
    REQUIRE(output.exit_status == 0);
    REQUIRE_FALSE(output.signaled);
}

TEST_CASE("run_process: Arguments are passed verbatim", "[subprocess]") {
    ProcessOutput output = run_process("/bin/sh", {"-c", "printf '%s|' \"$@\"", "sh", "a b", "$HOME", "'q'"});

    REQUIRE(output.stdout_bytes == "a b|$HOME|'q'|");
}

TEST_CASE("run_process: Binary output is preserved", "[subprocess]") {
    ProcessOutput output = run_process("/bin/sh", {"-c", "printf 'a\\000b\\377'"});

    REQUIRE(output.stdout_bytes.size() == 4);
    REQUIRE(output.stdout_bytes[1] == '\0');
    REQUIRE(static_cast<unsigned char>(output.stdout_bytes[3]) == 0xFF);
}

TEST_CASE("run_process: Reports exit status and signals", "[subprocess]") {
    SECTION("Non-zero exit") {
        ProcessOutput output = run_process("/bin/sh", {"-c", "exit 7"});
        REQUIRE(output.exit_status == 7);
        REQUIRE_FALSE(output.signaled);
    }

    SECTION("Killed by signal") {
        ProcessOutput output = run_process("/bin/sh", {"-c", "kill -9 $$"});
        REQUIRE(output.signaled);
        REQUIRE(output.exit_status == 9);
    }
}

TEST_CASE("run_process: Stdin is empty", "[subprocess]") {
    ProcessOutput output = run_process("/bin/sh", {"-c", "cat; printf done"});

    REQUIRE(output.stdout_bytes == "done");
}

TEST_CASE("run_process: Programs without a slash are found on PATH", "[subprocess]") {
    ProcessOutput output = run_process("sh", {"-c", "printf found"});

    REQUIRE(output.stdout_bytes == "found");
}

TEST_CASE("run_process: Launch failures throw", "[subprocess]") {
    SECTION("Missing program") {
        REQUIRE_THROWS_AS(run_process("/nonexistent/program", {}), ProcessLaunchError);
    }

    SECTION("Missing program on PATH") {
        REQUIRE_THROWS_AS(run_process("mfnf-no-such-program-on-path", {}), ProcessLaunchError);
    }

    SECTION("Directory is not executable") {
        REQUIRE_THROWS_AS(run_process(fs::temp_directory_path().string(), {}), ProcessLaunchError);
    }
}

TEST_CASE("read_until_eof: Reads a pipe to the end", "[subprocess]") {
    int fds[2];
    REQUIRE(::pipe(fds) == 0);

    const std::string payload = "+x^2";
    REQUIRE(::write(fds[1], payload.data(), payload.size()) == static_cast<ssize_t>(payload.size()));
    ::close(fds[1]);

    REQUIRE(read_until_eof(fds[0]) == payload);
    ::close(fds[0]);
}

TEST_CASE("read_until_eof: Read errors throw", "[subprocess]") {
    SECTION("Closed descriptor") {
        REQUIRE_THROWS_AS(read_until_eof(-1), ProcessReadError);
    }

    SECTION("Descriptor of a directory") {
        int fd = ::open(fs::temp_directory_path().c_str(), O_RDONLY | O_DIRECTORY);
        REQUIRE(fd >= 0);
        REQUIRE_THROWS_AS(read_until_eof(fd), ProcessReadError);
        ::close(fd);
    }
}

#include "utils.hpp"

namespace blendconv::test {
    using namespace std::string_view_literals;

    TEST_CASE("002: run_process captures stdout stderr and exit code", "[002][process]") {
        auto result = run_process({"/bin/sh", "-c", "echo out; echo err >&2; exit 3"});

        CHECK(result.exit_code == 3);
        CHECK_FALSE(result.success());
        CHECK(result.stdout_output == "out\n");
        CHECK(result.stderr_output == "err\n");
    }

    TEST_CASE("002: run_process reports success", "[002][process]") {
        auto result = run_process({"/bin/sh", "-c", "exit 0"});
        CHECK(result.success());
        CHECK(result.stdout_output.empty());
        CHECK(result.stderr_output.empty());
    }

    TEST_CASE("002: run_process maps signals to 128 + signo", "[002][process]") {
        auto result = run_process({"/bin/sh", "-c", "kill -TERM $$"});
        CHECK(result.exit_code == 128 + 15);
    }

    TEST_CASE("002: run_process drains large output", "[002][process]") {
        auto result = run_process({"/bin/sh", "-c", "i=0; while [ $i -lt 20000 ]; do echo line-$i; i=$((i+1)); done"});
        REQUIRE(result.success());
        CHECK(result.stdout_output.size() > 100'000U);
        CHECK(result.stdout_output.ends_with("line-19999\n"));
    }

    TEST_CASE("002: run_process throws spawn_failed for missing executables", "[002][process]") {
        detail::temp_dir temp{"blendconv_process_missing"};
        auto missing = (temp.path / "no-such-binary").string();

        try {
            (void)run_process({missing, "-b"});
            FAIL("expected spawn failure");
        } catch (const error& e) {
            CHECK(e.kind() == error_kind::spawn_failed);
            CHECK(std::string_view{e.what()}.find("no-such-binary") != std::string_view::npos);
        }
    }

    TEST_CASE("002: run_process rejects an empty command", "[002][process]") {
        try {
            (void)run_process({});
            FAIL("expected spawn failure");
        } catch (const error& e) {
            CHECK(e.kind() == error_kind::spawn_failed);
        }
    }

    TEST_CASE("002: format_command quotes arguments with shell metacharacters", "[002][process]") {
        CHECK(format_command({"blender", "-b", "scene.blend"}) == "blender -b scene.blend"sv);
        CHECK(format_command({"blender", "my scene.blend"}) == "blender 'my scene.blend'"sv);
        CHECK(format_command({"sh", "it's"}) == "sh 'it'\\''s'"sv);
        CHECK(format_command({"x", ""}) == "x ''"sv);
    }
}  // namespace blendconv::test

#include "utils.hpp"

namespace blendconv::test {
    using namespace std::string_view_literals;
    namespace fs = std::filesystem;

    TEST_CASE("005: convert writes the output and records the command", "[005][convert]") {
        detail::temp_dir temp{"blendconv_convert_ok"};
        detail::fake_toolchain tools{temp.path};
        tools.install_blender("blender");
        detail::scoped_env path_env{"PATH", tools.bin_dir.string()};

        auto input = temp.path / "blends" / "cube.blend";
        detail::write_text_file(input, "BLENDER-v402");

        auto record = convert(detail::isolated_options(), input, temp.path / "out" / "cube");

        auto expected = fs::absolute(temp.path / "out" / "cube.glb");
        CHECK(record.output == expected);
        CHECK(record.input == fs::canonical(input));
        CHECK(record.exit_code == 0);
        CHECK(record.elapsed_ms >= 0);
        REQUIRE(fs::exists(expected));
        CHECK(detail::read_text_file(expected) == "glTF");
        CHECK(record.stdout_output.find("Finished glTF 2.0 export") != std::string::npos);

        auto args = tools.last_args();
        REQUIRE(args.size() == 6U);
        CHECK(args[0] == "-b");
        CHECK(args[1] == fs::canonical(input).string());
        CHECK(args[2] == "--python-exit-code");
        CHECK(args[3] == "1");
        CHECK(args[4] == "--python-expr");
        CHECK(args[5].find("export_format=\"GLB\"") != std::string::npos);
        CHECK(args[5].find(expected.string()) != std::string::npos);
        CHECK(record.command.front() == "blender");
    }

    TEST_CASE("005: convert honours the output format", "[005][convert]") {
        detail::temp_dir temp{"blendconv_convert_gltf"};
        detail::fake_toolchain tools{temp.path};
        tools.install_blender("blender");
        detail::scoped_env path_env{"PATH", tools.bin_dir.string()};

        auto input = temp.path / "scene.blend";
        detail::write_text_file(input, "BLENDER-v402");

        auto options = detail::isolated_options();
        options.format = output_format::gltf_embedded;
        auto record = convert(options, input, temp.path / "scene.gltf");

        CHECK(record.output.filename() == "scene.gltf");
        CHECK(fs::exists(record.output));
        CHECK(tools.last_args().back().find("export_format=\"GLTF_EMBEDDED\"") != std::string::npos);
    }

    TEST_CASE("005: convert through flatpak", "[005][convert][flatpak]") {
        detail::temp_dir temp{"blendconv_convert_flatpak"};
        detail::fake_toolchain tools{temp.path};
        tools.install_flatpak();
        detail::scoped_env path_env{"PATH", tools.bin_dir.string()};

        auto input = temp.path / "scene.blend";
        detail::write_text_file(input, "BLENDER-v402");

        auto record = convert(detail::isolated_options(), input, temp.path / "scene");
        CHECK(fs::exists(record.output));
        REQUIRE(record.command.size() >= 3U);
        CHECK(record.command[0] == "flatpak");
        CHECK(record.command[1] == "run");
        CHECK(record.command[2] == "org.blender.Blender");
    }

    TEST_CASE("005: convert rejects files without the blend extension", "[005][convert][errors]") {
        detail::temp_dir temp{"blendconv_convert_bad_ext"};
        detail::fake_toolchain tools{temp.path};
        tools.install_blender("blender");
        detail::scoped_env path_env{"PATH", tools.bin_dir.string()};

        auto input = temp.path / "notes.txt";
        detail::write_text_file(input, "hello");

        try {
            (void)convert(detail::isolated_options(), input, temp.path / "notes");
            FAIL("expected invalid input");
        } catch (const error& e) {
            CHECK(e.kind() == error_kind::invalid_input_file);
        }
        CHECK_FALSE(fs::exists(tools.args_log));
    }

    TEST_CASE("005: convert rejects missing inputs", "[005][convert][errors]") {
        detail::temp_dir temp{"blendconv_convert_missing"};
        detail::fake_toolchain tools{temp.path};
        tools.install_blender("blender");
        detail::scoped_env path_env{"PATH", tools.bin_dir.string()};

        try {
            (void)convert(detail::isolated_options(), temp.path / "nope.blend", temp.path / "nope");
            FAIL("expected invalid input");
        } catch (const error& e) {
            CHECK(e.kind() == error_kind::invalid_input_file);
        }
    }

    TEST_CASE("005: non-zero blender exit is an export failure", "[005][convert][errors]") {
        detail::temp_dir temp{"blendconv_convert_exit"};
        detail::fake_toolchain tools{temp.path};
        tools.install_blender(
                "blender", {.convert_exit = 1, .write_output = false, .stderr_text = "Error: Python script failed"});
        detail::scoped_env path_env{"PATH", tools.bin_dir.string()};

        auto input = temp.path / "scene.blend";
        detail::write_text_file(input, "BLENDER-v402");

        try {
            (void)convert(detail::isolated_options(), input, temp.path / "scene");
            FAIL("expected export failure");
        } catch (const error& e) {
            CHECK(e.kind() == error_kind::export_failed);
            REQUIRE(e.exit_code());
            CHECK(*e.exit_code() == 1);
            CHECK(std::string_view{e.what()}.find("exit code 1") != std::string_view::npos);
            auto* failed = dynamic_cast<const export_error*>(&e);
            REQUIRE(failed != nullptr);
            CHECK(failed->record().exit_code == 1);
            CHECK(failed->record().stderr_output.find("Python script failed") != std::string::npos);
            CHECK(failed->record().command.front() == "blender");
            CHECK(std::string_view{e.what()}.find("Python script failed") != std::string_view::npos);
        }
    }

    TEST_CASE("005: successful exit without output is an export failure", "[005][convert][errors]") {
        detail::temp_dir temp{"blendconv_convert_no_output"};
        detail::fake_toolchain tools{temp.path};
        tools.install_blender("blender", {.write_output = false});
        detail::scoped_env path_env{"PATH", tools.bin_dir.string()};

        auto input = temp.path / "scene.blend";
        detail::write_text_file(input, "BLENDER-v402");

        try {
            (void)convert(detail::isolated_options(), input, temp.path / "scene");
            FAIL("expected export failure");
        } catch (const error& e) {
            CHECK(e.kind() == error_kind::export_failed);
            CHECK(std::string_view{e.what()}.find("was not written") != std::string_view::npos);
            CHECK_FALSE(e.exit_code());
        }
    }

    TEST_CASE("005: convert without blender reports missing executable", "[005][convert][errors]") {
        detail::temp_dir temp{"blendconv_convert_no_blender"};
        detail::fake_toolchain tools{temp.path};
        detail::scoped_env path_env{"PATH", tools.bin_dir.string()};

        auto input = temp.path / "scene.blend";
        detail::write_text_file(input, "BLENDER-v402");

        try {
            (void)convert(detail::isolated_options(), input, temp.path / "scene");
            FAIL("expected missing blender");
        } catch (const error& e) {
            CHECK(e.kind() == error_kind::missing_blender_executable);
        }
        CHECK_FALSE(fs::exists(temp.path / "scene.glb"));
    }
}  // namespace blendconv::test

#include "recon_splat/core/errors.hpp"
#include "recon_splat/core/utils.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;

namespace core = recon_splat::core;
using recon_splat::testing::TempDir;
using recon_splat::testing::make_executable;
using recon_splat::testing::touch;

TEST_CASE("normalize_extension_strips_dots_and_lowercases") {
    REQUIRE(core::normalize_extension("PNG") == "png");
    REQUIRE(core::normalize_extension(".png") == "png");
    REQUIRE(core::normalize_extension("..Jpg") == "jpg");
}

TEST_CASE("count_files_with_extensions_is_case_insensitive_and_flat") {
    TempDir tmp;
    touch(tmp / "a.jpg");
    touch(tmp / "b.JPG");
    touch(tmp / "c.jpeg");
    touch(tmp / "d.txt");
    touch(tmp / "nested" / "e.jpg");
    fs::create_directories(tmp / "dir.jpg");

    REQUIRE(core::count_files_with_extensions(tmp.path(), {"jpg"}) == 2);
    REQUIRE(core::count_files_with_extensions(tmp.path(), core::kImageExtensions) == 3);
}

TEST_CASE("count_files_with_extensions_missing_dir_is_zero") {
    TempDir tmp;
    REQUIRE(core::count_files_with_extensions(tmp / "nope", {"png"}) == 0);
    REQUIRE(core::count_files_with_extensions(fs::path(), {"png"}) == 0);
}

TEST_CASE("list_files_with_extensions_sorted") {
    TempDir tmp;
    touch(tmp / "b.png");
    touch(tmp / "a.png");
    touch(tmp / "c.PNG");
    auto files = core::list_files_with_extensions(tmp.path(), {"png"});
    REQUIRE(files.size() == 3);
    REQUIRE(files[0].filename() == "a.png");
    REQUIRE(files[1].filename() == "b.png");
    REQUIRE(files[2].filename() == "c.PNG");
}

TEST_CASE("shell_quote_leaves_plain_args_and_quotes_others") {
    REQUIRE(core::shell_quote("--database_path") == "--database_path");
    REQUIRE(core::shell_quote("/data/proj/db.db") == "/data/proj/db.db");
    REQUIRE(core::shell_quote("export_{iter}.ply") == "'export_{iter}.ply'");
    REQUIRE(core::shell_quote("it's") == "'it'\\''s'");
    REQUIRE(core::shell_quote("") == "''");
}

TEST_CASE("find_executable_explicit_path") {
    TempDir tmp;
    auto exe = make_executable(tmp / "brush");
    auto found = core::find_executable(exe.string());
    REQUIRE(found.has_value());
    REQUIRE(*found == exe);
    REQUIRE_FALSE(core::find_executable((tmp / "missing").string()).has_value());
}

TEST_CASE("find_executable_searches_path") {
    REQUIRE(core::find_executable("sh").has_value());
    REQUIRE_FALSE(core::find_executable("recon_splat_no_such_tool_42").has_value());
}

TEST_CASE("sha256_bytes_known_digest") {
    std::vector<uint8_t> abc = {'a', 'b', 'c'};
    REQUIRE(core::sha256_bytes(abc) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("run_id_format") {
    std::string id = core::get_run_id();
    REQUIRE(id.size() == 24);
    REQUIRE(id[8] == '_');
    REQUIRE(id[15] == '_');
}

TEST_CASE("read_text_missing_file_throws") {
    TempDir tmp;
    REQUIRE_THROWS_AS(core::read_text(tmp / "missing.txt"), recon_splat::IOError);
}

TEST_CASE("list_files_with_extensions_skips_looping_symlink") {
    TempDir tmp;
    touch(tmp / "a.jpg");
    touch(tmp / "b.jpg");
    fs::create_symlink("loop.jpg", tmp / "loop.jpg");

    std::vector<fs::path> files;
    REQUIRE_NOTHROW(files = core::list_files_with_extensions(tmp.path(), {"jpg"}));
    REQUIRE(files.size() == 2);
}

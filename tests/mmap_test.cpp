#include "tests/test_suite.hpp"
#include "tests/testing_utils.hpp"

#include "kiln/mmap.hpp"

#include <cassert>
#include <filesystem>
#include <print>

using namespace kiln;

bool mapped_file_test() {
    std::println("Starting Mapped File Test...");
    ScratchDir scratch("mapped_file");

    create_file("kiln.build", "DEF|A|1\n");
    auto file = MappedFile::map("kiln.build");
    assert(file);
    assert((*file)->content() == "DEF|A|1\n");

    // The view outlives every other handle to the mapping.
    auto view = (*file)->content();
    auto keep = *file;
    file = MappedFile::map("kiln.build");
    assert(keep->content() == view);

    create_file("empty.build", "");
    auto empty = MappedFile::map("empty.build");
    assert(empty && (*empty)->content().empty());

    std::filesystem::create_directory("dir.build");
    auto dir = MappedFile::map("dir.build");
    assert(!dir && dir.error().kind == ErrorKind::Io);

    auto missing = MappedFile::map("missing.build");
    assert(!missing && missing.error().kind == ErrorKind::Io);
    assert(missing.error().message.find("missing.build") != std::string::npos);

    std::println("Mapped File Test passed!");
    return true;
}

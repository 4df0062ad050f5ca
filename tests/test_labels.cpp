#include <doctest/doctest.h>

#include <tilewrap/labels.h>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <unistd.h>

using namespace tilewrap;

namespace {

class TempFile {
public:
    explicit TempFile(const std::string& content) {
        std::string tmpl = (std::filesystem::temp_directory_path() / "tilewrap_test_XXXXXX").string();
        int fd = mkstemp(tmpl.data());
        if (fd == -1) throw std::runtime_error("mkstemp failed");
        path_ = tmpl;
        ::write(fd, content.data(), content.size());
        ::close(fd);
    }

    ~TempFile() {
        std::filesystem::remove(path_);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace

TEST_CASE("Labels: built-in set fills a 10x10 grid") {
    const auto& labels = default_labels();
    CHECK(labels.size() == 100);
    CHECK(labels.front() == "😀");
    for (const auto& l : labels)
        CHECK_FALSE(l.empty());
}

TEST_CASE("Labels: one label per line") {
    TempFile file("alpha\nbeta\ngamma");
    auto labels = load_labels(file.path());

    REQUIRE(labels.size() == 3);
    CHECK(labels[0] == "alpha");
    CHECK(labels[1] == "beta");
    CHECK(labels[2] == "gamma");
}

TEST_CASE("Labels: CRLF and blank lines") {
    TempFile file("a\r\nb\n\n\r\n c \n");
    auto labels = load_labels(file.path());

    REQUIRE(labels.size() == 3);
    CHECK(labels[0] == "a");
    CHECK(labels[1] == "b");
    CHECK(labels[2] == " c ");
}

TEST_CASE("Labels: byte-order mark is skipped") {
    TempFile file("\xEF\xBB\xBF" "first\nsecond\n");
    auto labels = load_labels(file.path());

    REQUIRE(labels.size() == 2);
    CHECK(labels[0] == "first");
    CHECK(labels[1] == "second");
}

TEST_CASE("Labels: multi-byte text is kept intact") {
    TempFile file("日本\n🙂\nשלום\n");
    auto labels = load_labels(file.path());

    REQUIRE(labels.size() == 3);
    CHECK(labels[0] == "日本");
    CHECK(labels[1] == "🙂");
    CHECK(labels[2] == "שלום");
}

TEST_CASE("Labels: empty file") {
    TempFile file("");
    CHECK(load_labels(file.path()).empty());
}

TEST_CASE("Labels: missing file throws") {
    auto missing = std::filesystem::temp_directory_path() / "tilewrap_no_such_labels_file";
    std::filesystem::remove(missing);
    CHECK_THROWS_AS(load_labels(missing), std::runtime_error);
}

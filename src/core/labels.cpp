#include <tilewrap/labels.h>

#include <cstdio>
#include <memory>
#include <span>
#include <stdexcept>
#include <string_view>

namespace tilewrap {

namespace {

// Strip a UTF-8 byte-order mark, if present.
std::span<const std::byte> skip_bom(std::span<const std::byte> data) {
    if (data.size() >= 3 &&
        data[0] == std::byte{0xEF} &&
        data[1] == std::byte{0xBB} &&
        data[2] == std::byte{0xBF}) {
        return data.subspan(3);
    }
    return data;
}

struct FileCloser {
    void operator()(std::FILE* f) const { std::fclose(f); }
};

} // namespace

const std::vector<std::string>& default_labels() {
    static const std::vector<std::string> labels = {
        "😀", "😃", "😄", "😁", "😆", "😅", "🤣", "😂", "🙂", "🙃",
        "😉", "😊", "😇", "🥰", "😍", "🤩", "😘", "😗", "😚", "😙",
        "😋", "😛", "😜", "🤪", "😝", "🤑", "🤗", "🤭", "🤫", "🤔",
        "🤐", "🤨", "😐", "😑", "😶", "😏", "😒", "🙄", "😬", "🤥",
        "😌", "😔", "😪", "🤤", "😴", "😷", "🤒", "🤕", "🤢", "🤮",
        "🤧", "🥵", "🥶", "🥴", "😵", "🤯", "🤠", "🥳", "😎", "🤓",
        "🧐", "😕", "😟", "🙁", "😮", "😯", "😲", "😳", "🥺", "😦",
        "😧", "😨", "😰", "😥", "😢", "😭", "😱", "😖", "😣", "😞",
        "😓", "😩", "😫", "🥱", "😤", "😡", "😠", "🤬", "😈", "👿",
        "💀", "💩", "🤡", "👹", "👺", "👻", "👽", "👾", "🤖", "😺",
    };
    return labels;
}

std::vector<std::string> load_labels(const std::filesystem::path& path) {
    std::unique_ptr<std::FILE, FileCloser> file(std::fopen(path.c_str(), "rb"));
    if (!file)
        throw std::runtime_error("Failed to open labels file: " + path.string());

    std::string raw;
    char buf[4096];
    std::size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), file.get())) > 0)
        raw.append(buf, n);
    if (std::ferror(file.get()))
        throw std::runtime_error("Failed to read labels file: " + path.string());

    auto bytes = skip_bom(std::as_bytes(std::span(raw.data(), raw.size())));
    std::string_view text(reinterpret_cast<const char*>(bytes.data()), bytes.size());

    std::vector<std::string> labels;
    while (!text.empty()) {
        size_t nl = text.find('\n');
        std::string_view line = text.substr(0, nl);
        text = nl == std::string_view::npos ? std::string_view{} : text.substr(nl + 1);

        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        if (!line.empty())
            labels.emplace_back(line);
    }
    return labels;
}

} // namespace tilewrap

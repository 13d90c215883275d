#include <kodiak/parallel/fan_out.hpp>
#include <kodiak/runtime/text.hpp>

#include <regex>

namespace kodiak::runtime {

namespace {

void replace_all(std::string& text, std::string_view from, std::string_view to) {
    std::size_t pos = text.find(from);
    if (pos == std::string::npos) {
        return;
    }
    std::string out;
    out.reserve(text.size());
    std::size_t last = 0;
    while (pos != std::string::npos) {
        out.append(text, last, pos - last);
        out.append(to);
        last = pos + from.size();
        pos = text.find(from, last);
    }
    out.append(text, last, std::string::npos);
    text = std::move(out);
}

/// `$` introduces back-references in a regex_replace format string.
auto literal_format(std::string_view to) -> std::string {
    std::string out;
    out.reserve(to.size());
    for (char ch : to) {
        if (ch == '$') {
            out.push_back('$');
        }
        out.push_back(ch);
    }
    return out;
}

}  // namespace

auto escape_regex(std::string_view text) -> std::string {
    constexpr std::string_view kSpecial = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(text.size() * 2);
    for (char ch : text) {
        if (kSpecial.find(ch) != std::string_view::npos) {
            out.push_back('\\');
        }
        out.push_back(ch);
    }
    return out;
}

void replace(Series& series, std::string_view from, std::string_view to,
             const ExecConfig& config) {
    if (!series.is_string() || series.empty() || from.empty()) {
        return;
    }
    auto& column = series.string_column();
    parallel::for_each_chunk("replace", column.size(), config,
                             [&](const parallel::Chunk& chunk) {
                                 for (std::size_t i = chunk.start; i < chunk.end; ++i) {
                                     replace_all(column[i], from, to);
                                 }
                             });
}

void replace_whole_word(Series& series, std::string_view from, std::string_view to,
                        const ExecConfig& config) {
    if (!series.is_string() || series.empty() || from.empty()) {
        return;
    }
    // Compiled once; workers only read it.
    const std::regex pattern("\\b" + escape_regex(from) + "\\b");
    const std::string format = literal_format(to);

    auto& column = series.string_column();
    parallel::for_each_chunk("replace_whole_word", column.size(), config,
                             [&](const parallel::Chunk& chunk) {
                                 for (std::size_t i = chunk.start; i < chunk.end; ++i) {
                                     auto& value = column[i];
                                     if (!std::regex_search(value, pattern)) {
                                         continue;
                                     }
                                     value = std::regex_replace(value, pattern, format);
                                 }
                             });
}

}  // namespace kodiak::runtime

/**
 * @file ContentExtractor.cpp
 * @brief Implementation of ContentExtractor.
 */

#include "infrastructure/ContentExtractor.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <vector>

namespace tidyfile::infrastructure {

namespace {

constexpr int kPdfPages = 3;

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool HasContent(const std::string& text) {
    return std::any_of(text.begin(), text.end(), [](unsigned char c) { return !std::isspace(c); });
}

} // namespace

std::optional<std::string> ContentExtractor::extract(const std::string& path, std::size_t maxLength) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        std::cerr << "[ContentExtractor] Not a regular file: " << path << std::endl;
        return std::nullopt;
    }

    std::string ext = ToLower(std::filesystem::path(path).extension().string());
    // One byte past the limit shows whether the cut lands inside a character.
    std::size_t readLength = maxLength + 1;
    std::optional<std::string> content;
    if (ext == ".pdf") {
        content = ExtractPdf(path, readLength);
    } else if (ext == ".docx") {
        content = ExtractDocx(path, readLength);
    } else if (ext == ".doc" || IsImageExtension(ext)) {
        return std::nullopt;
    } else {
        content = ExtractText(path, readLength);
    }

    if (!content) {
        return std::nullopt;
    }
    content = TruncateUtf8(*content, maxLength);
    if (!HasContent(*content)) {
        return std::nullopt;
    }
    return content;
}

std::string ContentExtractor::TruncateUtf8(const std::string& s, std::size_t maxBytes) {
    if (s.size() <= maxBytes) return s;
    std::size_t cut = maxBytes;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    return s.substr(0, cut);
}

bool ContentExtractor::IsImageExtension(const std::string& extension) {
    static const std::vector<std::string> kImages = {".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tiff", ".webp"};
    return std::find(kImages.begin(), kImages.end(), ToLower(extension)) != kImages.end();
}

bool ContentExtractor::LooksLikeText(const std::string& content) {
    if (content.empty()) return false;
    std::size_t printable = 0;
    for (unsigned char c : content) {
        // UTF-8 continuation and lead bytes count as text
        if (std::isprint(c) || std::isspace(c) || c >= 0x80) {
            ++printable;
        }
    }
    return static_cast<double>(printable) / static_cast<double>(content.size()) > 0.7;
}

std::string ContentExtractor::StripXml(const std::string& xml) {
    std::string out;
    out.reserve(xml.size() / 4);
    bool inTag = false;
    std::string tag;
    for (char c : xml) {
        if (c == '<') {
            inTag = true;
            tag.clear();
        } else if (c == '>') {
            inTag = false;
            if (tag == "/w:p" || tag == "w:br" || tag == "w:br/") {
                out.push_back('\n');
            }
        } else if (inTag) {
            tag.push_back(c);
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::optional<std::string> ContentExtractor::ExtractText(const std::string& path, std::size_t maxLength) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[ContentExtractor] Could not open " << path << std::endl;
        return std::nullopt;
    }
    std::string buffer(maxLength, '\0');
    file.read(&buffer[0], static_cast<std::streamsize>(maxLength));
    buffer.resize(static_cast<std::size_t>(file.gcount()));
    if (!LooksLikeText(buffer)) {
        return std::nullopt;
    }
    return buffer;
}

std::optional<std::string> ContentExtractor::ExtractPdf(const std::string& path, std::size_t maxLength) {
    if (!HasTool("pdftotext")) {
        std::cerr << "[ContentExtractor] pdftotext not available, skipping " << path << std::endl;
        return std::nullopt;
    }
    return RunCommand("pdftotext -l " + std::to_string(kPdfPages) + " " + ShellQuote(path) + " - 2>/dev/null",
                      maxLength);
}

std::optional<std::string> ContentExtractor::ExtractDocx(const std::string& path, std::size_t maxLength) {
    if (!HasTool("unzip")) {
        std::cerr << "[ContentExtractor] unzip not available, skipping " << path << std::endl;
        return std::nullopt;
    }
    // The markup is several times larger than the text it wraps.
    auto xml = RunCommand("unzip -p " + ShellQuote(path) + " word/document.xml 2>/dev/null", maxLength * 16);
    if (!xml) {
        return std::nullopt;
    }
    return StripXml(*xml);
}

std::optional<std::string> ContentExtractor::RunCommand(const std::string& cmd, std::size_t maxBytes) {
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        std::cerr << "[ContentExtractor] popen failed for: " << cmd << std::endl;
        return std::nullopt;
    }
    std::string output;
    char buffer[4096];
    std::size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        if (output.size() < maxBytes) {
            output.append(buffer, std::min(n, maxBytes - output.size()));
        }
        // Keep draining so the child is not killed by SIGPIPE before exit.
    }
    int rc = pclose(pipe);
    if (rc != 0 && output.empty()) {
        std::cerr << "[ContentExtractor] Command exited with code " << rc << ": " << cmd << std::endl;
        return std::nullopt;
    }
    return output;
}

std::string ContentExtractor::ShellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

bool ContentExtractor::HasTool(const std::string& tool) {
    std::string cmd = "command -v " + tool + " >/dev/null 2>&1";
    return std::system(cmd.c_str()) == 0;
}

} // namespace tidyfile::infrastructure

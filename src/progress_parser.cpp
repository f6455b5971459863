#include "progress_parser.hpp"
#include <algorithm>
#include <cctype>

namespace motus {

const char* const kTransferredBytesKey = "Transferred";
const char* const kTransferredFilesKey = "Transferred files";

static const int kKeyWidth = 15;

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

static bool is_alpha(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

static std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && is_space(s[start])) ++start;
    size_t end = s.size();
    while (end > start && is_space(s[end - 1])) --end;
    return s.substr(start, end - start);
}

std::string strip_repaint(const std::string& raw) {
    size_t keep_from = 0;
    size_t i = 0;
    while (i < raw.size()) {
        if (raw[i] != '\x1b' || i + 1 >= raw.size() || raw[i + 1] != '[') {
            ++i;
            continue;
        }
        size_t j = i + 2;
        size_t digits_start = j;
        while (j < raw.size() && is_digit(raw[j])) ++j;
        std::string digits = raw.substr(digits_start, j - digits_start);

        if (j < raw.size() && (raw[j] == 'K' || raw[j] == 'A' || raw[j] == 'G')) {
            keep_from = j + 1;
            i = j + 1;
        } else if (digits == "0") {
            // Bare reset: the following character belongs to the text
            keep_from = j;
            i = j;
        } else {
            i = j;
        }
    }
    return trim(raw.substr(keep_from));
}

bool is_count_transfer(const std::string& value) {
    std::string v = trim(value);
    size_t i = 0;
    if (i >= v.size() || !is_digit(v[i])) return false;
    while (i < v.size() && is_digit(v[i])) ++i;
    while (i < v.size() && is_space(v[i])) ++i;
    if (i >= v.size() || v[i] != '/') return false;
    ++i;
    while (i < v.size() && is_space(v[i])) ++i;
    if (i >= v.size() || !is_digit(v[i])) return false;
    while (i < v.size() && is_digit(v[i])) ++i;
    // A unit or decimal point right after the number means a byte quantity
    return i == v.size() || !(is_alpha(v[i]) || v[i] == '.');
}

bool is_byte_transfer(const std::string& value) {
    size_t slash = value.find('/');
    if (slash == std::string::npos) return false;

    std::string amount = trim(value.substr(0, slash));
    if (amount.empty() || !is_digit(amount[0])) return false;

    // Number, optional space, unit ending in B/Byte/Bytes: "0 B", "1.699 GiB", "12 MByte"
    size_t i = 0;
    while (i < amount.size() && (is_digit(amount[i]) || amount[i] == '.')) ++i;
    while (i < amount.size() && is_space(amount[i])) ++i;
    std::string unit = amount.substr(i);
    if (unit.empty()) return false;
    for (char c : unit) {
        if (!is_alpha(c)) return false;
    }
    return unit.find('B') != std::string::npos;
}

int percent_of(const std::string& value) {
    size_t pos = value.find('%');
    while (pos != std::string::npos) {
        size_t start = pos;
        while (start > 0 && is_digit(value[start - 1])) --start;
        if (start < pos) {
            try {
                return std::min(100, std::stoi(value.substr(start, pos - start)));
            } catch (const std::exception&) {
                return -1;
            }
        }
        pos = value.find('%', pos + 1);
    }
    return -1;
}

ParsedLine parse_line(const std::string& raw) {
    ParsedLine result;
    std::string line = strip_repaint(raw);
    if (line.empty()) return result;

    size_t error_pos = line.find("ERROR");
    if (error_pos != std::string::npos) {
        result.kind = ParsedLine::Kind::ErrorFragment;
        result.value = line.substr(error_pos);
        return result;
    }

    if (!is_alpha(line[0])) return result;

    size_t colon = 0;
    while (colon < line.size() && (is_alpha(line[colon]) || line[colon] == ' ')) ++colon;
    if (colon >= line.size() || line[colon] != ':') return result;

    std::string key = trim(line.substr(0, colon));
    std::string value = trim(line.substr(colon + 1));

    if (key == kTransferredBytesKey) {
        if (is_count_transfer(value)) {
            key = kTransferredFilesKey;
        } else if (!is_byte_transfer(value)) {
            return result;
        }
    }

    result.kind = ParsedLine::Kind::Field;
    result.key = key;
    result.value = value;
    return result;
}

ProgressTracker::ProgressTracker(size_t error_limit) : error_limit_(error_limit) {}

void ProgressTracker::feed(const std::string& raw_line) {
    ParsedLine parsed = parse_line(raw_line);
    switch (parsed.kind) {
    case ParsedLine::Kind::ErrorFragment:
        append_error(parsed.value);
        break;
    case ParsedLine::Kind::Field:
        set_field(parsed.key, parsed.value);
        recompute();
        break;
    case ParsedLine::Kind::None:
        break;
    }
}

void ProgressTracker::append_error(const std::string& fragment) {
    error_text_ += fragment;
    error_text_ += '\n';
    if (error_text_.size() > error_limit_) {
        error_text_.erase(0, error_text_.size() - error_limit_);
    }
}

void ProgressTracker::mark_complete() {
    percent_ = 100;
    recompute();
}

std::string ProgressTracker::field(const std::string& key) const {
    for (const auto& entry : fields_) {
        if (entry.first == key) return entry.second;
    }
    return "";
}

void ProgressTracker::set_field(const std::string& key, const std::string& value) {
    for (auto& entry : fields_) {
        if (entry.first == key) {
            entry.second = value;
            return;
        }
    }
    fields_.emplace_back(key, value);
}

void ProgressTracker::recompute() {
    std::string text;
    for (const auto& [key, value] : fields_) {
        if (!text.empty()) text += '\n';
        if (static_cast<int>(key.size()) < kKeyWidth) {
            text.append(kKeyWidth - key.size(), ' ');
        }
        text += key + ": " + value;
    }
    text_ = text;

    // Bytes first, then file count, then checks
    int candidate = percent_of(field(kTransferredBytesKey));
    if (candidate < 0) candidate = percent_of(field(kTransferredFilesKey));
    if (candidate < 0) candidate = percent_of(field("Checks"));

    if (candidate > percent_) {
        percent_ = candidate;
    }
}

} // namespace motus

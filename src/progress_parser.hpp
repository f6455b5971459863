#pragma once

#include <string>
#include <vector>
#include <utility>
#include <cstddef>

namespace motus {

/**
 * Classification of one raw line of rclone --progress output.
 */
struct ParsedLine {
    enum class Kind {
        None,           // blank, repaint-only or unrecognised
        Field,          // "Key: value" status field
        ErrorFragment   // text from the ERROR marker onwards
    };

    Kind kind = Kind::None;
    std::string key;    // internal field key (Field only)
    std::string value;  // field value or error fragment
};

// Internal keys for the two forms of "Transferred"
extern const char* const kTransferredBytesKey;   // "Transferred"
extern const char* const kTransferredFilesKey;   // "Transferred files"

/**
 * Drop terminal repaint sequences (ESC[2K, ESC[<n>A, ESC[<n>G, bare ESC[0)
 * and keep only the text after the last one. Surrounding whitespace and a
 * trailing carriage return are trimmed.
 */
std::string strip_repaint(const std::string& raw);

/**
 * Stateless line classifier.
 */
ParsedLine parse_line(const std::string& raw);

// "1.699 GiB / 1.953 GiB, 87%, ..." style value
bool is_byte_transfer(const std::string& value);
// "0 / 1, 0%" style value
bool is_count_transfer(const std::string& value);

// First "<n>%" in a value, or -1 if none
int percent_of(const std::string& value);

/**
 * Per-job accumulated progress state fed line by line.
 *
 * Not thread-safe; the owner serializes access.
 */
class ProgressTracker {
public:
    explicit ProgressTracker(size_t error_limit = 10000);

    // Classify and apply one stdout line
    void feed(const std::string& raw_line);

    // Append an error fragment (a newline is added), keeping the trailing window
    void append_error(const std::string& fragment);

    // Process observed terminal: percent becomes 100 and stays there
    void mark_complete();

    int percent() const { return percent_; }
    const std::string& text() const { return text_; }
    const std::string& error_text() const { return error_text_; }

    // Current value of a field, "" if never seen
    std::string field(const std::string& key) const;

private:
    void set_field(const std::string& key, const std::string& value);
    void recompute();

    std::vector<std::pair<std::string, std::string>> fields_;  // first-seen order
    int percent_ = 0;
    std::string text_;
    std::string error_text_;
    size_t error_limit_;
};

} // namespace motus

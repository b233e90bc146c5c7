#ifndef _CodeCapture_utils_h_
#define _CodeCapture_utils_h_

namespace Capture {

// String utilities
std::string trim_copy(const std::string& s);
std::string to_lower_copy(std::string s);
bool starts_with_icase(const std::string& s, const std::string& prefix);
bool is_blank(const std::string& s);
std::string json_escape(const std::string& s);
std::string join_args(const std::vector<std::string>& args, size_t start = 0);

// Line-ending utilities
std::string normalize_newlines(const std::string& s);
std::string ensure_trailing_newline(std::string s);

// File utilities (throw std::runtime_error on I/O failure)
std::string read_text_file(const std::filesystem::path& path);
void write_text_file(const std::filesystem::path& path, const std::string& content);

// Path utilities
bool is_within_root(const std::filesystem::path& root, const std::filesystem::path& candidate);
std::filesystem::path canonical_root(const std::filesystem::path& root);

// Exec utilities
std::optional<std::string> find_executable(const std::string& name);
bool has_cmd(const std::string& name);

// Hash utilities (BLAKE3, hex encoded)
std::string compute_string_hash(const std::string& data);

// Time utilities
std::string format_local_time(const char* fmt);

}

#endif

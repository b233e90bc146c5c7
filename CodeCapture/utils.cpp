#include "CodeCapture.h"
#include <blake3.h>

namespace Capture {

// String utilities
std::string trim_copy(const std::string& s){
    size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) --b;
    return s.substr(a, b - a);
}

std::string to_lower_copy(std::string s){
    for(char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool starts_with_icase(const std::string& s, const std::string& prefix){
    if(prefix.size() > s.size()) return false;
    for(size_t i = 0; i < prefix.size(); ++i){
        if(std::tolower(static_cast<unsigned char>(s[i])) != std::tolower(static_cast<unsigned char>(prefix[i])))
            return false;
    }
    return true;
}

bool is_blank(const std::string& s){
    return std::all_of(s.begin(), s.end(), [](char c){ return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

std::string join_args(const std::vector<std::string>& args, size_t start){
    std::string out;
    for(size_t i = start; i < args.size(); ++i){
        if(i > start) out.push_back(' ');
        out += args[i];
    }
    return out;
}

std::string json_escape(const std::string& s){
    std::string o; o.reserve(s.size()+8);
    for(char c: s){
        switch(c){
            case '"': o+="\\\""; break;
            case '\\': o+="\\\\"; break;
            case '\n': o+="\\n"; break;
            case '\r': o+="\\r"; break;
            case '\t': o+="\\t"; break;
            case '\b': o+="\\b"; break;
            case '\f': o+="\\f"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    o += buf;
                } else {
                    o += c;
                }
        }
    }
    return o;
}

// Line-ending utilities
std::string normalize_newlines(const std::string& s){
    std::string out;
    out.reserve(s.size());
    for(size_t i = 0; i < s.size(); ++i){
        if(s[i] == '\r' && i + 1 < s.size() && s[i+1] == '\n') continue;
        out.push_back(s[i]);
    }
    return out;
}

std::string ensure_trailing_newline(std::string s){
    if(s.empty() || s.back() != '\n') s.push_back('\n');
    return s;
}

// File utilities
std::string read_text_file(const std::filesystem::path& path){
    std::ifstream in(path, std::ios::binary);
    if(!in) throw std::runtime_error("cannot open '" + path.string() + "' for reading");
    std::ostringstream oss;
    oss << in.rdbuf();
    if(in.bad()) throw std::runtime_error("read failed for '" + path.string() + "'");
    return oss.str();
}

void write_text_file(const std::filesystem::path& path, const std::string& content){
    std::error_code ec;
    if(path.has_parent_path()){
        std::filesystem::create_directories(path.parent_path(), ec);
        if(ec) throw std::runtime_error("cannot create directory '" + path.parent_path().string() + "': " + ec.message());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if(!out) throw std::runtime_error("cannot open '" + path.string() + "' for writing");
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if(!out) throw std::runtime_error("write failed for '" + path.string() + "'");
}

// Path utilities
std::filesystem::path canonical_root(const std::filesystem::path& root){
    std::error_code ec;
    auto abs = std::filesystem::absolute(root, ec);
    if(ec) abs = root;
    auto canon = std::filesystem::weakly_canonical(abs, ec);
    if(ec) canon = abs.lexically_normal();
    if(canon.has_relative_path() && canon.filename().empty()) canon = canon.parent_path();
    return canon;
}

// Component-wise ancestor test; a root never contains itself.
bool is_within_root(const std::filesystem::path& root, const std::filesystem::path& candidate){
    auto r = root.lexically_normal();
    auto c = candidate.lexically_normal();
    if(r.has_relative_path() && r.filename().empty()) r = r.parent_path();
    if(c.has_relative_path() && c.filename().empty()) c = c.parent_path();
    if(r.empty() || c.empty()) return false;
    if(r.is_absolute() != c.is_absolute()) return false;

    auto ri = r.begin();
    auto ci = c.begin();
    for(; ri != r.end(); ++ri, ++ci){
        if(ci == c.end() || *ri != *ci) return false;
    }
    return ci != c.end();
}

// Exec utilities
std::optional<std::string> find_executable(const std::string& name){
    if(name.empty()) return std::nullopt;
    if(name.find('/') != std::string::npos){
        if(::access(name.c_str(), X_OK) == 0) return name;
        return std::nullopt;
    }
    const char* env_path = std::getenv("PATH");
    std::string search = env_path ? env_path : "/usr/local/bin:/usr/bin:/bin";
    std::istringstream iss(search);
    std::string dir;
    while(std::getline(iss, dir, ':')){
        if(dir.empty()) dir = ".";
        std::filesystem::path candidate = std::filesystem::path(dir) / name;
        std::error_code ec;
        if(std::filesystem::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0)
            return candidate.string();
    }
    return std::nullopt;
}

bool has_cmd(const std::string& name){
    return find_executable(name).has_value();
}

// BLAKE3 hash functions
std::string compute_string_hash(const std::string& data){
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data.data(), data.size());
    uint8_t output[BLAKE3_OUT_LEN];
    blake3_hasher_finalize(&hasher, output, BLAKE3_OUT_LEN);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for(size_t i = 0; i < BLAKE3_OUT_LEN; ++i){
        oss << std::setw(2) << static_cast<unsigned>(output[i]);
    }
    return oss.str();
}

// Time utilities
std::string format_local_time(const char* fmt){
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &local);
    return std::string(buf, n);
}

}

#include "quantum_surface/core/utils.hpp"
#include "quantum_surface/core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

#include <openssl/evp.h>

namespace quantum_surface::core {

namespace {

std::string format_time(TimePoint tp, bool utc, bool with_millis) {
    auto time_t_now = Clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf;
    if (utc) {
        gmtime_r(&time_t_now, &tm_buf);
    } else {
        localtime_r(&time_t_now, &tm_buf);
    }

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    if (with_millis) {
        oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    }
    if (utc) oss << 'Z';
    return oss.str();
}

std::string digest_to_hex(const unsigned char* hash, unsigned int len) {
    std::ostringstream oss;
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return oss.str();
}

} // namespace

std::string get_iso_timestamp() {
    return format_time(Clock::now(), true, true);
}

std::string format_iso_utc(TimePoint tp) {
    return format_time(tp, true, true);
}

std::string format_iso_local(TimePoint tp) {
    return format_time(tp, false, true);
}

std::string get_run_id() {
    auto now = Clock::now();
    auto time_t_now = Clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_';

    const char* hex = "0123456789abcdef";
    for (int i = 0; i < 8; ++i) {
        oss << hex[dis(gen)];
    }

    return oss.str();
}

std::string read_text(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

void write_text(const fs::path& path, const std::string& text) {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw IOError("Cannot create directory: " + path.parent_path().string() +
                          " (" + ec.message() + ")");
        }
    }
    std::ofstream file(path);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file << text;
    if (!file) {
        throw IOError("Cannot write file: " + path.string());
    }
}

std::vector<fs::path> list_files(const fs::path& dir, const std::string& prefix,
                                 const std::string& ext) {
    std::vector<fs::path> files;

    if (!fs::exists(dir) || !fs::is_directory(dir)) {
        return files;
    }

    for (const auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file()) continue;
        const std::string name = entry.path().filename().string();
        if (starts_with(name, prefix) && ends_with(name, ext)) {
            files.push_back(entry.path());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::string sha256_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) throw IOError("Cannot allocate digest context");
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw IOError("SHA-256 init failed");
    }

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx, buffer, static_cast<size_t>(file.gcount())) != 1) {
            EVP_MD_CTX_free(ctx);
            throw IOError("SHA-256 update failed: " + path.string());
        }
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hash_len) != 1) {
        EVP_MD_CTX_free(ctx);
        throw IOError("SHA-256 final failed: " + path.string());
    }
    EVP_MD_CTX_free(ctx);

    return digest_to_hex(hash, hash_len);
}

double fract(double x) {
    double f = x - std::floor(x);
    // floor() of a tiny negative value can round the difference up to 1.0
    return f >= 1.0 ? 0.0 : f;
}

double wrap_two_pi(double angle) {
    return fract(angle / kTwoPi) * kTwoPi;
}

double wrapped_phi_distance(double phi_a, double phi_b) {
    double d = std::fabs(phi_a - phi_b);
    d = std::fmod(d, kTwoPi);
    return std::min(d, kTwoPi - d);
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(const std::string& s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(s.begin(), s.end(), not_space);
    auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    if (begin >= end) return std::string();
    return std::string(begin, end);
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace quantum_surface::core

#include "heat_overlay/core/utils.hpp"
#include "heat_overlay/core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <limits>
#include <locale>
#include <random>
#include <sstream>

#include <openssl/evp.h>

namespace heat_overlay::core {

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

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

std::vector<uint8_t> read_bytes(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        throw IOError("Cannot read file: " + path.string());
    }

    return buffer;
}

std::vector<uint8_t> read_bytes_limited(const fs::path& path, std::uintmax_t max_bytes,
                                        const std::string& what) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        throw IOError("Cannot stat file: " + path.string() + " (" + ec.message() + ")");
    }
    if (size > max_bytes) {
        throw InputTooLargeError(what + " file too large (max " + std::to_string(max_bytes) +
                                 " bytes allowed)");
    }
    return read_bytes(path);
}

void write_bytes(const fs::path& path, const std::vector<uint8_t>& data) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    if (!file) {
        throw IOError("Cannot write file: " + path.string());
    }
}

std::string sha256_bytes(const std::vector<uint8_t>& data) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw HeatOverlayError("EVP_MD_CTX_new failed");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    const bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
                    EVP_DigestUpdate(ctx, data.data(), data.size()) == 1 &&
                    EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok) {
        throw HeatOverlayError("SHA-256 digest failed");
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return oss.str();
}

std::string sha256_file(const fs::path& path) {
    auto data = read_bytes(path);
    return sha256_bytes(data);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(s.begin(), s.end(), not_space);
    auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    if (begin >= end) return "";
    return std::string(begin, end);
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = str.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(str.substr(start));
            break;
        }
        parts.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

namespace {

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

// Copies a run of digits into out, skipping single underscores that sit
// between two digits. Returns the position after the run.
size_t scan_digits(const std::string& s, size_t pos, std::string& out) {
    const size_t start = pos;
    while (pos < s.size()) {
        if (is_digit(s[pos])) {
            out += s[pos++];
        } else if (s[pos] == '_' && pos > start && pos + 1 < s.size() && is_digit(s[pos + 1])) {
            ++pos;
        } else {
            break;
        }
    }
    return pos;
}

} // namespace

std::optional<double> parse_double(const std::string& s) {
    const std::string token = trim(s);
    const double inf = std::numeric_limits<double>::infinity();

    size_t pos = 0;
    bool negative = false;
    if (pos < token.size() && (token[pos] == '+' || token[pos] == '-')) {
        negative = token[pos] == '-';
        ++pos;
    }

    const std::string word = to_lower(token.substr(pos));
    if (word == "inf" || word == "infinity") {
        return negative ? -inf : inf;
    }
    if (word == "nan") {
        return std::numeric_limits<double>::quiet_NaN();
    }

    // Decimal only: digits [. digits] [e [sign] digits]. No hex, no C suffixes.
    std::string int_part;
    std::string frac_part;
    std::string exp_part;
    pos = scan_digits(token, pos, int_part);
    if (pos < token.size() && token[pos] == '.') {
        pos = scan_digits(token, pos + 1, frac_part);
    }
    if (int_part.empty() && frac_part.empty()) return std::nullopt;

    bool exp_negative = false;
    if (pos < token.size() && (token[pos] == 'e' || token[pos] == 'E')) {
        ++pos;
        if (pos < token.size() && (token[pos] == '+' || token[pos] == '-')) {
            exp_negative = token[pos] == '-';
            ++pos;
        }
        pos = scan_digits(token, pos, exp_part);
        if (exp_part.empty()) return std::nullopt;
    }
    if (pos != token.size()) return std::nullopt;

    std::string canonical = negative ? "-" : "";
    canonical += int_part.empty() ? "0" : int_part;
    canonical += '.';
    canonical += frac_part.empty() ? "0" : frac_part;
    if (!exp_part.empty()) {
        canonical += exp_negative ? "e-" : "e";
        canonical += exp_part;
    }

    std::istringstream iss(canonical);
    iss.imbue(std::locale::classic());
    double value = 0.0;
    iss >> value;
    if (iss.fail()) {
        // Out of double range: overflow saturates to infinity, underflow to zero.
        if (std::abs(value) == std::numeric_limits<double>::max()) {
            return negative ? -inf : inf;
        }
        return negative ? -0.0 : 0.0;
    }
    // Infinite values are later dropped by rasterization as out of bounds.
    return value;
}

} // namespace heat_overlay::core

#include "utils.hpp"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> random_bytes(std::size_t count){
    std::vector<unsigned char> out(count);
    if(count == 0) return out;
    if(RAND_bytes(out.data(), static_cast<int>(out.size())) != 1){
        char reason[256];
        ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
        throw std::runtime_error(std::string("RAND_bytes failed: ") + reason);
    }
    return out;
}

std::string make_share_id(){
    auto bytes = random_bytes(16);
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);
    auto hex = hex_from_bytes(bytes);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

std::string to_lower_copy(std::string value){
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string trim_copy(std::string value){
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
      [](unsigned char ch){ return !std::isspace(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
      [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
    return value;
}

bool less_case_insensitive(const std::string& a, const std::string& b){
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
      [](unsigned char x, unsigned char y){ return std::tolower(x) < std::tolower(y); });
}

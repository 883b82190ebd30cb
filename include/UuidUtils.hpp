#pragma once

#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace modsync {

class UuidUtils {
public:
  // Random (version 4) UUID in canonical 8-4-4-4-12 form
  static std::string generate() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<unsigned int> dist(0, 255);

    unsigned char bytes[16];
    for (auto &b : bytes)
      b = static_cast<unsigned char>(dist(engine));
    bytes[6] = (bytes[6] & 0x0f) | 0x40;
    bytes[8] = (bytes[8] & 0x3f) | 0x80;

    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
      if (i == 4 || i == 6 || i == 8 || i == 10)
        out << '-';
      out << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return out.str();
  }
};

} // namespace modsync

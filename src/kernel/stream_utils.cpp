// ndflow kernel: bounded line copies over NDJSON streams
#include "kernel/stream_utils.hpp"

namespace nf {

std::size_t copy_lines(std::istream& in, std::ostream& out) {
  std::size_t count = 0;
  std::string line;
  while (std::getline(in, line)) {
    out << line << '\n';
    ++count;
  }
  out.flush();
  return count;
}

std::size_t head_lines(std::istream& in, std::ostream& out, std::size_t n) {
  std::size_t count = 0;
  std::string line;
  while (count < n && std::getline(in, line)) {
    out << line << '\n';
    ++count;
  }
  out.flush();
  return count;
}

std::size_t tail_lines(std::istream& in, std::ostream& out, std::size_t n) {
  LineRing ring(n);
  std::string line;
  while (std::getline(in, line)) ring.push(line);
  for (const auto& l : ring.lines()) out << l << '\n';
  out.flush();
  return ring.lines().size();
}

}  // namespace nf

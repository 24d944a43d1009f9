#include "MessageFramer.hpp"

namespace mcpv {
vector<string> MessageFramer::append(const string& chunk) {
  vector<string> lines;
  buffer.append(chunk);
  size_t start = 0;
  while (true) {
    auto newline = buffer.find('\n', start);
    if (newline == string::npos) {
      break;
    }
    lines.push_back(buffer.substr(start, newline - start));
    start = newline + 1;
  }
  buffer.erase(0, start);
  return lines;
}

optional<string> MessageFramer::flush() {
  if (buffer.empty()) {
    return nullopt;
  }
  string last;
  last.swap(buffer);
  return last;
}
}  // namespace mcpv

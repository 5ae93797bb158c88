#include <linegrep/search_result.hpp>

std::vector<std::string_view> search_result::match_texts() const {
  std::vector<std::string_view> texts;
  texts.reserve(matches.size());
  const std::string_view view(line);
  for (const auto &[from, to] : matches) {
    texts.push_back(view.substr(from, to - from));
  }
  return texts;
}

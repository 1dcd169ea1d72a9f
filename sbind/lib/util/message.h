#ifndef SBIND_LIB_UTIL_MESSAGE_H_
#define SBIND_LIB_UTIL_MESSAGE_H_
#include <string>
#include <string_view>
#include <iostream>
#include <algorithm>
#include <util/util.h>
namespace util::message {

// A diagnostic that can be printed, optionally against the source text the
// offending token was taken from.
struct base {
  virtual void print(std::ostream &) const = 0;
  virtual void link_file(std::string_view file, std::string_view filename = "source") = 0;
  virtual ~base() = default;
};

namespace style {

static constexpr std::string_view bold = "\e[1m";
static constexpr std::string_view clear = "\e[0m";

struct error {
  static constexpr std::string_view name = "error";
  static constexpr std::string_view escape = "\e[31m";
};

}

// Reports a token. The text is copied; location keeps the view it was built
// from, so once linked to the file it points into the line is printed with the
// token underlined. Tokens built from text that is not part of any file get an
// empty location.
template<typename Style>
struct report_token : public virtual base {
  std::string token;
  std::string_view location, file, filename;
  explicit report_token(std::string_view token) : token(token), location(token) {}
  report_token(std::string text, std::string_view location) : token(std::move(text)), location(location) {}
  void link_file(std::string_view f, std::string_view fname) final {
    if (!location.empty() && location.begin() >= f.begin() && location.end() <= f.end()) {
      file = f;
      filename = fname;
    }
  }

  virtual void describe(std::ostream &os) const = 0;
  void print(std::ostream &os) const final {
    std::string_view tk = location;
    const bool located = !file.empty() && !tk.empty() && tk.begin() >= file.begin() && tk.end() <= file.end();
    std::size_t posy = 0, posx = 0;
    os << style::bold;
    if (located) {
      posy = std::count(file.begin(), tk.begin(), '\n') + 1;
      posx = std::distance(std::find(std::string_view::const_reverse_iterator(tk.begin()), file.crend(), '\n').base(),
                           tk.begin()) + 1;
      os << filename << ":" << posy << ":" << posx << ": ";
    }
    os << Style::escape << Style::name << ": " << style::clear;
    describe(os);
    os << std::endl;
    if (located) {
      auto line_begin = tk.begin() - (posx - 1);
      auto line_end = std::find(tk.begin(), file.end(), '\n');
      if (line_end < tk.end())tk.remove_suffix(std::distance(line_end, tk.end()));
      for (int w = int(5) - int(std::to_string(posy).size()); w > 0; w--)os << ' ';
      os << posy << " | " << std::string_view(line_begin, tk.begin()) << style::bold << Style::escape << tk
         << style::clear << std::string_view(tk.end(), line_end) << std::endl;
      os << "      |" << std::string(posx, ' ') << style::bold << Style::escape << "^";
      for (int w = int(tk.size()) - 1; w > 0; w--)os << '~';
      os << style::clear << std::endl;
    }
  }
};
typedef report_token<style::error> error_token;

}
#endif //SBIND_LIB_UTIL_MESSAGE_H_

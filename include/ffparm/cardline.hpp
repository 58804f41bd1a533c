// Copyright 2024 Global Phasing Ltd.
//
// Reading logical lines of CHARMM card files (parameters and topology):
// title lines start with '*', '!' starts a comment and a line ending
// with a blank followed by '-' continues on the next line.

#ifndef FFPARM_CARDLINE_HPP_
#define FFPARM_CARDLINE_HPP_

#include <cstdio>   // for EOF
#include <cstring>  // for strlen
#include <string>
#include <vector>
#include "atox.hpp"   // for skip_blank, is_blank
#include "input.hpp"  // for AnyStream
#include "logger.hpp" // for Logger
#include "util.hpp"   // for split_str_multi, trim_str

namespace ffparm {

struct CardLineReader {
  // longer physical lines are truncated and reported through the logger
  enum { MaxLineLength = 1024 };

  AnyStream& stream;
  const std::string& source;
  const Logger& logger;
  int line_num = 0;      // number of the last physical line read
  std::string line;      // current logical line, without comments
  std::vector<std::string> words;

  CardLineReader(AnyStream& s, const std::string& source_, const Logger& logger_)
    : stream(s), source(source_), logger(logger_) {}

  // Returns false at the end of input.
  bool next() {
    char buf[MaxLineLength + 1];
    line.clear();
    words.clear();
    for (;;) {
      if (!read_physical_line(buf, sizeof(buf)))
        break;
      ++line_num;
      const char* start = skip_blank(buf);
      if (*start == '*' && line.empty())
        continue;
      std::string card(start);
      size_t excl = card.find('!');
      if (excl != std::string::npos)
        card.resize(excl);
      card = trim_str(card);
      if (!card.empty() && card.back() == '-' &&
          (card.size() == 1 || is_blank(card[card.size() - 2]))) {
        card.pop_back();
        line += card;
        continue;
      }
      line += card;
      words = split_str_multi(line);
      if (!words.empty())
        return true;
      line.clear();
    }
    words = split_str_multi(line);
    return !words.empty();
  }

private:
  bool read_physical_line(char* buf, int size) {
    if (!stream.gets(buf, size))
      return false;
    size_t len = std::strlen(buf);
    if (len + 1 == (size_t) size && buf[len-1] != '\n') {
      int c = stream.getc();
      if (c != EOF && c != '\n') {
        logger.err(source, ':', line_num + 1, ": line longer than ",
                   (int) MaxLineLength, " characters was truncated");
        while (c != EOF && c != '\n')
          c = stream.getc();
      }
    }
    return true;
  }
};

} // namespace ffparm
#endif

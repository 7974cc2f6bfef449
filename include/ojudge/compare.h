#ifndef INCLUDE_OJUDGE_COMPARE_H_
#define INCLUDE_OJUDGE_COMPARE_H_

#include <string>
#include <functional>

// (actual, expected) -> passed
using Comparator = std::function<bool(const std::string&, const std::string&)>;

// Specs, space separated:
//   exact                 equal after trimming leading & trailing whitespace (default)
//   strict                byte-for-byte
//   line                  line by line, ignoring trailing whitespace and trailing blank lines
//   white-diff            token by token
//   float-diff [absolute|relative|absolute-relative] [threshold]
//                         token by token, tokens that look like floats compared within threshold
// Throws ValidationError on an unknown spec.
Comparator MakeComparator(const std::string& spec);

#endif  // INCLUDE_OJUDGE_COMPARE_H_

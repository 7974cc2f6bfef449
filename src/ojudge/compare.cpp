#include <ojudge/compare.h>

#include <cmath>
#include <cstdlib>
#include <algorithm>
#include <sstream>
#include <vector>

#include <ojudge/errors.h>

namespace {

constexpr char kWhites[] = " \n\r\t\x0b\x0c";

std::string Trim(const std::string& str) {
  size_t begin = str.find_first_not_of(kWhites);
  if (begin == std::string::npos) return "";
  return str.substr(begin, str.find_last_not_of(kWhites) - begin + 1);
}

bool LineCompare(std::istream& f_ans, std::istream& f_usr) {
  constexpr char kLineWhites[] = " \n\r\t";
  for (; f_ans.eof() == f_usr.eof();) {
    if (f_ans.eof()) return true;
    std::string s, t;
    getline(f_ans, s);
    getline(f_usr, t);
    // std::string::npos + 1 == 0
    s.erase(s.find_last_not_of(kLineWhites) + 1);
    t.erase(t.find_last_not_of(kLineWhites) + 1);
    if (s != t) return false;
  }
  // the remaining lines of the longer one must be blank
  while (!f_ans.eof() || !f_usr.eof()) {
    std::string s;
    if (!f_ans.eof()) {
      getline(f_ans, s);
    } else {
      getline(f_usr, s);
    }
    if (s.find_last_not_of(kLineWhites) != std::string::npos) return false;
  }
  return true;
}

template <class Func>
bool WordCompare(std::istream& f_ans, std::istream& f_usr, Func&& func) {
  for (; f_ans.eof() == f_usr.eof();) {
    if (f_ans.eof()) return true;
    std::string s, t;
    getline(f_ans, s);
    getline(f_usr, t);
    for (size_t i1 = 0, i2 = 0;;) {
      i1 = s.find_first_not_of(kWhites, i1);
      i2 = t.find_first_not_of(kWhites, i2);
      if ((i1 == std::string::npos) != (i2 == std::string::npos)) return false;
      if (i1 == std::string::npos) break;
      size_t j1 = s.find_first_of(kWhites, i1);
      size_t j2 = t.find_first_of(kWhites, i2);
      if (j1 == std::string::npos) j1 = s.size();
      if (j2 == std::string::npos) j2 = t.size();
      if (!func(s.substr(i1, j1 - i1), t.substr(i2, j2 - i2))) return false;
      i1 = j1, i2 = j2;
    }
  }
  while (!f_ans.eof() || !f_usr.eof()) {
    std::string s;
    if (!f_ans.eof()) {
      getline(f_ans, s);
    } else {
      getline(f_usr, s);
    }
    if (s.find_last_not_of(kWhites) != std::string::npos) return false;
  }
  return true;
}

template <class Func>
Comparator MakeWordComparator(Func func) {
  return [func](const std::string& actual, const std::string& expected) {
    std::istringstream f_ans(expected), f_usr(actual);
    return WordCompare(f_ans, f_usr, func);
  };
}

template <class Func>
auto FloatCheck(Func func) {
  return [func](const std::string& ans, const std::string& usr) {
    // this avoids treating integers as floating point
    if (ans.find_first_of(".eExXnN") == std::string::npos) return ans == usr;
    // strtold is locale dependent only in the decimal point, which the judge never changes
    char *end_ans, *end_usr;
    long double fans = strtold(ans.c_str(), &end_ans), fusr = strtold(usr.c_str(), &end_usr);
    if (*end_ans || *end_usr || end_ans == ans.c_str() || end_usr == usr.c_str()) return ans == usr;
    return func(fans, fusr);
  };
}

} // namespace

Comparator MakeComparator(const std::string& spec) {
  std::vector<std::string> args;
  {
    std::istringstream sin(spec);
    for (std::string str; sin >> str;) args.push_back(str);
  }
  std::string type = args.empty() ? "exact" : args[0];
  if (type == "exact") {
    if (args.size() > 1) throw ValidationError("exact comparator takes no arguments");
    return [](const std::string& actual, const std::string& expected) {
      return Trim(actual) == Trim(expected);
    };
  }
  if (type == "strict") {
    if (args.size() > 1) throw ValidationError("strict comparator takes no arguments");
    return [](const std::string& actual, const std::string& expected) { return actual == expected; };
  }
  if (type == "line") {
    if (args.size() > 1) throw ValidationError("line comparator takes no arguments");
    return [](const std::string& actual, const std::string& expected) {
      std::istringstream f_ans(expected), f_usr(actual);
      return LineCompare(f_ans, f_usr);
    };
  }
  if (type == "white-diff") {
    if (args.size() > 1) throw ValidationError("white-diff comparator takes no arguments");
    return MakeWordComparator([](const std::string& ans, const std::string& usr) { return ans == usr; });
  }
  if (type == "float-diff") {
    std::string subtype = args.size() > 1 ? args[1] : "absolute-relative";
    long double threshold = 1e-6;
    if (args.size() > 2) {
      char* end;
      threshold = strtold(args[2].c_str(), &end);
      if (*end || !(threshold >= 0)) throw ValidationError("invalid float-diff threshold: " + args[2]);
    }
    if (args.size() > 3) throw ValidationError("too many float-diff arguments");
    if (subtype == "absolute") {
      return MakeWordComparator(FloatCheck([threshold](long double ans, long double usr) {
        return std::fabs(ans - usr) <= threshold;
      }));
    } else if (subtype == "relative") {
      return MakeWordComparator(FloatCheck([threshold](long double ans, long double usr) {
        return std::fabs(ans - usr) <= threshold * std::fabs(ans);
      }));
    } else if (subtype == "absolute-relative") {
      return MakeWordComparator(FloatCheck([threshold](long double ans, long double usr) {
        return std::fabs(ans - usr) <= threshold * std::max(1.0L, std::fabs(ans));
      }));
    }
    throw ValidationError("unknown float-diff mode: " + subtype);
  }
  throw ValidationError("unknown comparator: " + type);
}

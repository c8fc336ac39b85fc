#include "verhoeff/verhoeff.hpp"
#include <iostream>
#include <vector>
#include <string>
#include <chrono>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>

namespace {

enum class Mode { Compute, Validate, Append, Id };

struct Options {
  Mode mode = Mode::Validate;
  std::size_t length = verhoeff::AADHAAR_LENGTH;
  unsigned repeats = 1;
  bool quiet = false;
  std::vector<std::string> inputs;
};

bool parse_mode(const std::string& s, Mode& out) {
  if (s == "compute") { out = Mode::Compute; return true; }
  if (s == "validate") { out = Mode::Validate; return true; }
  if (s == "append") { out = Mode::Append; return true; }
  if (s == "id") { out = Mode::Id; return true; }
  return false;
}

// Decimal count in [1, max]. Rejects signs, which std::stoul would accept
// and wrap.
bool parse_count(const std::string& s, unsigned long max, unsigned long& out) {
  if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos)
    return false;
  try {
    out = std::stoul(s);
  } catch (const std::out_of_range&) {
    return false;
  }
  return out >= 1 && out <= max;
}

// Runs one input in the selected mode; returns false on error or on a
// failed validation.
bool run_one(const Options& opt, const std::string& in, bool print) {
  switch (opt.mode) {
  case Mode::Compute: {
    auto r = verhoeff::compute_checksum_strict(in);
    if (!r) { if (print) std::cerr << in << " -> error: " << r.error() << "\n"; return false; }
    if (print) std::cout << in << " -> check=" << unsigned(r.value()) << "\n";
    return true;
  }
  case Mode::Validate: {
    auto r = verhoeff::validate_strict(in);
    if (!r) { if (print) std::cerr << in << " -> error: " << r.error() << "\n"; return false; }
    if (print) std::cout << in << " -> " << (r.value() ? "VALID" : "INVALID") << "\n";
    return r.value();
  }
  case Mode::Append: {
    auto r = verhoeff::compute_checksum_strict(in);
    if (!r) { if (print) std::cerr << in << " -> error: " << r.error() << "\n"; return false; }
    if (print) std::cout << in << " -> " << in << char('0' + r.value()) << "\n";
    return true;
  }
  case Mode::Id: {
    auto r = verhoeff::validate_fixed_length_id(in, opt.length);
    if (!r) { if (print) std::cerr << in << " -> error: " << r.error() << "\n"; return false; }
    if (print) std::cout << in << " -> " << (r.value() ? "VALID" : "INVALID") << "\n";
    return r.value();
  }
  }
  return false;
}

// Shown when no inputs are given.
void demo() {
  std::cout << "engine: " << verhoeff::engine_info() << "\n\n";

  std::cout << "1. Calculating checksum:\n";
  for (const char* n : {"12345", "987654321", "1111111111"})
    std::cout << "   " << n << " -> check=" << unsigned(verhoeff::compute_checksum(n)) << "\n";

  std::cout << "\n2. Validating numbers:\n";
  for (const char* n : {"123451", "123450", "9876543217", "9876543210"})
    std::cout << "   " << n << " -> " << (verhoeff::validate(n) ? "VALID" : "INVALID") << "\n";

  std::cout << "\n3. Appending checksums:\n";
  for (const char* n : {"12345678901", "98765432109", "55555555555"})
    std::cout << "   " << n << " -> " << verhoeff::append_checksum(n) << "\n";

  std::cout << "\n4. Aadhaar validation:\n";
  const std::string valid_id = verhoeff::append_checksum("12345678901");
  for (const std::string& n : {valid_id, std::string("123456789019"), std::string("12345")}) {
    auto r = verhoeff::validate_aadhaar(n);
    std::cout << "   " << n << " -> ";
    if (!r) std::cout << "error: " << r.error() << "\n";
    else std::cout << (r.value() ? "VALID" : "INVALID checksum") << "\n";
  }

  std::cout << "\n5. Error detection:\n";
  const std::string complete = verhoeff::append_checksum("12345");
  std::string substituted = complete;
  substituted[2] = '9';
  std::string swapped = complete;
  std::swap(swapped[1], swapped[2]);
  std::cout << "   substitution " << complete << " -> " << substituted << ": "
            << (verhoeff::validate(substituted) ? "missed" : "detected") << "\n";
  std::cout << "   transposition " << complete << " -> " << swapped << ": "
            << (verhoeff::validate(swapped) ? "missed" : "detected") << "\n";
}

} // namespace

int main(int argc, char** argv) {
  // Flags: --mode=compute|validate|append|id, --length=N, --bench=N, --quiet
  Options opt;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    unsigned long v = 0;
    if (a.rfind("--mode=", 0) == 0) {
      if (!parse_mode(a.substr(7), opt.mode)) {
        std::cerr << "unknown mode '" << a.substr(7) << "'\n";
        return 2;
      }
    } else if (a.rfind("--length=", 0) == 0) {
      if (!parse_count(a.substr(9), std::numeric_limits<std::size_t>::max(), v)) {
        std::cerr << "bad value in '" << a << "': expected a length >= 1\n";
        return 2;
      }
      opt.length = static_cast<std::size_t>(v);
    } else if (a.rfind("--bench=", 0) == 0) {
      if (!parse_count(a.substr(8), std::numeric_limits<unsigned>::max(), v)) {
        std::cerr << "bad value in '" << a << "': expected a repeat count >= 1\n";
        return 2;
      }
      opt.repeats = static_cast<unsigned>(v);
    } else if (a == "--quiet") {
      opt.quiet = true;
    } else if (a.rfind("--", 0) == 0) {
      std::cerr << "unknown flag '" << a << "'\n";
      return 2;
    } else {
      opt.inputs.push_back(a);
    }
  }

  if (opt.inputs.empty()) {
    demo();
    return 0;
  }

  bool all_ok = true;
  for (const auto& in : opt.inputs) {
    bool ok = run_one(opt, in, !opt.quiet);
    all_ok = all_ok && ok;

    if (opt.repeats > 1) {
      std::uint64_t best = UINT64_MAX, sum = 0;
      for (unsigned r = 0; r < opt.repeats; ++r) {
        auto t0 = std::chrono::steady_clock::now();
        run_one(opt, in, false);
        auto t1 = std::chrono::steady_clock::now();
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count();
        sum += ns; if ((std::uint64_t)ns < best) best = ns;
      }
      if (!opt.quiet)
        std::cout << in << " bench repeats=" << opt.repeats
                  << " | best(ns)=" << best << " | avg(ns)=" << (sum / opt.repeats) << "\n";
    }
  }
  return all_ok ? 0 : 1;
}

#pragma once
#include <stdexcept>
#include <string>

namespace cli {

// bad or missing flag; commands map it to exit code 2
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

bool has_flag(int argc, char** argv, const std::string& key);
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);
// throws UsageError when the value is not an integer
int get_arg_int(int argc, char** argv, const std::string& key, int def);
// throws UsageError when the flag is absent or empty
std::string require_arg(int argc, char** argv, const std::string& key);

}  // namespace cli

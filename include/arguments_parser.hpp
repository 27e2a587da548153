#pragma once

#include <string_view>
#include <functional>
#include <cstdio>
#include <string>
#include <vector>
#include <typeinfo>
#include <any>
#include <map>

namespace arguments
{

// fills `config`, problems end up in `diagnostic`
void parse(int argc, const char** argv, std::FILE* out);

namespace detail
{

  struct CmdOption
  {
    std::vector<std::string_view> opt;
    std::string_view description;
    std::any default_value;
    std::string_view default_value_str;
    std::function<std::any(const std::vector<std::string_view>&)> parser;

    // `--opt=value`, takes exactly one argument
    bool has_equals;

    // flags take no argument, they are recognized by a bool default
    bool is_flag() const
    { return default_value.type() == typeid(bool); }
  };
  struct CmdOptions
  {
  private:
    struct CmdOptionsAdder
    {
      // opts is a comma separated alias list, "-name" stands for "--name",
      // an empty alias marks the option receiving arguments that follow no option
      CmdOptionsAdder& operator()(std::string_view opts, std::string_view description,
                                  std::any default_value, std::string_view default_value_str,
                                  const std::function<std::any(const std::vector<std::string_view>&)>& f);

      CmdOptions* ot;
    };
    friend struct CmdParse;
  public:
    CmdOptions(std::string_view name, std::string_view description)
      : name(name), description(description)
    {  }

    CmdOptionsAdder add_options();

    // keyed by every alias, equals options carry a trailing '='
    std::map<std::string, std::any> parse(int argc, const char** argv);

    void print_help(std::FILE* f) const;
  private:
    std::string_view name;
    std::string_view description;

    std::vector<CmdOption> data;
  };

}

}

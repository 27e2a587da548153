#pragma once

#include <config.hpp>

#include <string_view>
#include <string>

struct driver
{
  // runs the configured emit class over every input file
  void go();

  // output of the configured emit class for one module, diagnostics go to `diagnostic`
  static std::string run(const std::string& text, std::string_view module);
};

#pragma once

#include <segram/grammar_library.hpp>
#include <segram/xml_reader.hpp>

#include <string>

namespace segram {

  inline const std::string grammar_ns = "http://segram.dev/grammar";

  class grammar_loader {
  public:
    grammar_library
    load(xml_reader& reader);
  };

} // namespace segram

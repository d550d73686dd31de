#pragma once

#include <segram/segment.hpp>
#include <segram/xml_reader.hpp>

#include <string>
#include <vector>

namespace segram {

  inline const std::string segments_ns = "http://segram.dev/segments";

  // Owns loaded segments and hands out borrowed views of them.
  class segment_document {
    std::vector<segment> segments_;

  public:
    segment_document() = default;

    explicit segment_document(std::vector<segment> segments)
        : segments_(std::move(segments)) {}

    const std::vector<segment>&
    segments() const {
      return segments_;
    }

    segment_list
    view() const;
  };

  class segment_loader {
  public:
    segment_document
    load(xml_reader& reader);
  };

} // namespace segram

#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <set>
#include <stdexcept>
#include <string_view>

#include "dashstream/v1.hpp"

namespace dashstream::manifest {

class ManifestParseError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Representation index -> selected. An empty filter selects everything.
using RepresentationFilter = std::function<bool(std::size_t)>;

/*
  Counts SegmentTimeline entries per representation.

  Representations are indexed by document order across the whole MPD, which
  is the $RepresentationID$ used in init-{i} / chunk-{i}-NNNNN file names.
  A representation without its own SegmentTemplate uses the one on its
  AdaptationSet. Each <S> contributes r+1 entries when r >= 0, else 1.

  Throws ManifestParseError when the text is not well-formed XML or has no
  MPD root.
*/
std::map<std::size_t, std::size_t> CountTimelineSegments(std::string_view xml, const RepresentationFilter& filter = {});

// Representations a profile needs for the startup window.
std::set<std::size_t> RequiredRepresentations(dashstream::v1::ManifestProfile profile);

} // namespace dashstream::manifest

#include "manifest_parser.hpp"

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <sstream>
#include <string>

namespace dashstream::manifest {
namespace pt = boost::property_tree;

namespace {

std::size_t CountTimeline(const pt::ptree& timeline) {
  std::size_t count = 0;
  for (const auto& [name, node] : timeline) {
    if (name != "S") {
      continue;
    }
    const auto repeat = node.get_optional<long long>("<xmlattr>.r");
    count += repeat && *repeat >= 0 ? static_cast<std::size_t>(*repeat) + 1 : 1;
  }
  return count;
}

const pt::ptree* FindTimeline(const pt::ptree& node) {
  auto tmpl = node.get_child_optional("SegmentTemplate");
  if (!tmpl) {
    return nullptr;
  }
  auto timeline = tmpl->get_child_optional("SegmentTimeline");
  return timeline ? &timeline.get() : nullptr;
}

} // namespace

std::map<std::size_t, std::size_t> CountTimelineSegments(std::string_view xml, const RepresentationFilter& filter) {
  pt::ptree          doc;
  std::istringstream in{std::string(xml)};
  try {
    pt::read_xml(in, doc);
  } catch (const pt::xml_parser_error& e) {
    throw ManifestParseError(std::string("malformed manifest: ") + e.what());
  }

  auto mpd = doc.get_child_optional("MPD");
  if (!mpd) {
    throw ManifestParseError("malformed manifest: missing MPD root");
  }

  std::map<std::size_t, std::size_t> counts;
  std::size_t                        index = 0;

  for (const auto& [period_name, period] : *mpd) {
    if (period_name != "Period") {
      continue;
    }
    for (const auto& [set_name, adaptation_set] : period) {
      if (set_name != "AdaptationSet") {
        continue;
      }
      const pt::ptree* shared_timeline = FindTimeline(adaptation_set);

      for (const auto& [rep_name, representation] : adaptation_set) {
        if (rep_name != "Representation") {
          continue;
        }
        const auto current = index++;
        if (filter && !filter(current)) {
          continue;
        }

        const pt::ptree* timeline = FindTimeline(representation);
        if (!timeline) {
          timeline = shared_timeline;
        }
        counts[current] = timeline ? CountTimeline(*timeline) : 0;
      }
    }
  }

  return counts;
}

std::set<std::size_t> RequiredRepresentations(dashstream::v1::ManifestProfile profile) {
  if (profile == dashstream::v1::MANIFEST_PROFILE_STEADY_STATE_DUAL) {
    return {0, 1};
  }
  return {0};
}

} // namespace dashstream::manifest

#include "internal/manifest/manifest_parser.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/readiness/startup_window.hpp"
#include "support/fakes.hpp"

namespace {

using dashstream::manifest::CountTimelineSegments;
using dashstream::manifest::ManifestParseError;
using dashstream::manifest::RequiredRepresentations;
using dashstream::readiness::CheckStartupWindow;
using dashstream::testing::FakeAssetFileSystem;
using dashstream::testing::MakeManifest;

constexpr const char* kSharedTemplateManifest = R"(<?xml version="1.0"?>
<MPD xmlns="urn:mpeg:dash:schema:mpd:2011">
  <Period>
    <AdaptationSet id="0">
      <SegmentTemplate timescale="48000" media="chunk-$RepresentationID$-$Number%05d$.webm">
        <SegmentTimeline>
          <S t="0" d="96000" r="1"/>
          <S d="48000"/>
          <S d="96000" r="-1"/>
        </SegmentTimeline>
      </SegmentTemplate>
      <Representation id="0" bandwidth="128000"/>
      <Representation id="1" bandwidth="64000">
        <SegmentTemplate timescale="48000">
          <SegmentTimeline>
            <S t="0" d="96000" r="9"/>
          </SegmentTimeline>
        </SegmentTemplate>
      </Representation>
    </AdaptationSet>
    <AdaptationSet id="1">
      <Representation id="2" bandwidth="32000"/>
    </AdaptationSet>
  </Period>
</MPD>
)";

void TestRepeatCountsAndSharedTemplate() {
  auto counts = CountTimelineSegments(kSharedTemplateManifest);
  assert(counts.size() == 3);
  // r=1 -> 2, plain S -> 1, negative r -> 1
  assert(counts.at(0) == 4);
  assert(counts.at(1) == 10);
  assert(counts.at(2) == 0);
}

void TestFilterSelectsRepresentations() {
  auto counts = CountTimelineSegments(kSharedTemplateManifest, [](std::size_t index) { return index == 1; });
  assert(counts.size() == 1);
  assert(counts.at(1) == 10);
}

void TestIndicesRunAcrossAdaptationSets() {
  auto counts = CountTimelineSegments(MakeManifest({3, 5}));
  assert(counts.at(0) == 3);
  assert(counts.at(1) == 5);
}

void TestMalformedXmlThrows() {
  bool threw = false;
  try {
    (void)CountTimelineSegments("<MPD><Period>");
  } catch (const ManifestParseError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)CountTimelineSegments("<NotAnMpd/>");
  } catch (const ManifestParseError&) {
    threw = true;
  }
  assert(threw && "a document without an MPD root is not a manifest");
}

void TestRequiredRepresentationsPerProfile() {
  assert(RequiredRepresentations(dashstream::v1::MANIFEST_PROFILE_STARTUP_SINGLE) == std::set<std::size_t>({0}));
  assert(RequiredRepresentations(dashstream::v1::MANIFEST_PROFILE_STEADY_STATE_DUAL) == std::set<std::size_t>({0, 1}));
  assert(RequiredRepresentations(dashstream::v1::MANIFEST_PROFILE_UNSPECIFIED) == std::set<std::size_t>({0}));
}

void TestStartupWindowNeedsInitAndThreeChunks() {
  FakeAssetFileSystem fs;
  const std::filesystem::path dir = "/assets/t1";
  const auto                  xml = MakeManifest({4});

  auto status = CheckStartupWindow(fs, dir, xml, dashstream::v1::MANIFEST_PROFILE_STARTUP_SINGLE);
  assert(!status.Ready());
  assert(status.representations.size() == 1);
  assert(status.representations[0].timeline_entries == 4);
  assert(!status.representations[0].init_present);

  fs.Put(dir / "init-0.m4s");
  fs.Put(dir / "chunk-0-00001.m4s");
  fs.Put(dir / "chunk-0-00003.m4s");
  status = CheckStartupWindow(fs, dir, xml, dashstream::v1::MANIFEST_PROFILE_STARTUP_SINGLE);
  assert(!status.Ready());
  assert(status.representations[0].chunks_present == 1);

  // either container satisfies the check
  fs.Put(dir / "chunk-0-00002.webm");
  status = CheckStartupWindow(fs, dir, xml, dashstream::v1::MANIFEST_PROFILE_STARTUP_SINGLE);
  assert(status.Ready());
}

void TestStartupWindowRejectsShortTimeline() {
  FakeAssetFileSystem fs;
  const std::filesystem::path dir = "/assets/t2";
  fs.Put(dir / "init-0.m4s");
  fs.Put(dir / "chunk-0-00001.m4s");
  fs.Put(dir / "chunk-0-00002.m4s");
  fs.Put(dir / "chunk-0-00003.m4s");

  auto status = CheckStartupWindow(fs, dir, MakeManifest({2}), dashstream::v1::MANIFEST_PROFILE_STARTUP_SINGLE);
  assert(!status.Ready());
}

void TestDualProfileNeedsSecondRepresentation() {
  FakeAssetFileSystem fs;
  const std::filesystem::path dir = "/assets/t3";
  for (int rep = 0; rep < 2; ++rep) {
    fs.Put(dir / ("init-" + std::to_string(rep) + ".m4s"));
    for (int chunk = 1; chunk <= 3; ++chunk) {
      fs.Put(dir / ("chunk-" + std::to_string(rep) + "-0000" + std::to_string(chunk) + ".m4s"));
    }
  }

  assert(CheckStartupWindow(fs, dir, MakeManifest({3, 3}), dashstream::v1::MANIFEST_PROFILE_STEADY_STATE_DUAL).Ready());

  auto single_rep = CheckStartupWindow(fs, dir, MakeManifest({3}), dashstream::v1::MANIFEST_PROFILE_STEADY_STATE_DUAL);
  assert(!single_rep.Ready());
  assert(single_rep.representations.size() == 2);
  assert(single_rep.representations[1].timeline_entries == 0);
}

} // namespace

int main() {
  TestRepeatCountsAndSharedTemplate();
  TestFilterSelectsRepresentations();
  TestIndicesRunAcrossAdaptationSets();
  TestMalformedXmlThrows();
  TestRequiredRepresentationsPerProfile();
  TestStartupWindowNeedsInitAndThreeChunks();
  TestStartupWindowRejectsShortTimeline();
  TestDualProfileNeedsSecondRepresentation();

  std::cout << "dashstream_unit_manifest_parser: pass\n";
  return 0;
}

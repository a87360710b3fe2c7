#include "pipesplit/analysis/analyze.hpp"
#include "pipesplit/analysis/lowest_common_ancestor.hpp"
#include "pipesplit/analysis/replicable_branches.hpp"
#include "pipesplit/diag/invalid_graph_shape.hpp"
#include "pipesplit/diag/logging.hpp"
#include "pipesplit/graph/traverse.hpp"
#include "pipesplit/pipeline/Pipeline.hpp"
#include "util/stages.hpp"
#include <fmt/format.h>
#include <gtest/gtest.h>

using namespace pipesplit;
using pipeline::Pipeline;
using pipeline::Stage;
using pipeline::StageKind;
using test::idOf;

namespace {

// A typical multiprocessing layout: a dispatching source feeding a
// placeholder per worker, merged with a replicable side branch.
struct WorkerPipeline {
  Pipeline p;
  Stage &src = p.add("src");
  Stage &rr = p.add(StageKind::RoundRobinDispatch, "rr", {&src});
  Stage &ph = p.add(StageKind::Placeholder, "ph", {&rr});
  Stage &map = p.add("map", {&ph});
  Stage &side = p.add("side");
  Stage &zip = p.add("zip", {&map, &side});
};

} // namespace

TEST(analysis_analyze, matches_the_individual_analyses) {
  WorkerPipeline w;
  graph::StageGraph g = graph::traverse(w.zip);

  analysis::DispatchPlan plan = analysis::analyze(g);

  EXPECT_EQ(plan.cutPoint, analysis::compute_cut_point(g));
  EXPECT_EQ(plan.replicableBranches,
            analysis::compute_replicable_branches(g));

  // Marking stops at the placeholder in branch extraction only.
  ASSERT_TRUE(plan.cutPoint.has_value());
  EXPECT_EQ(*plan.cutPoint, idOf(g, w.rr));
  ASSERT_EQ(plan.replicableBranches.size(), 1u);
  EXPECT_EQ(plan.replicableBranches[0], idOf(g, w.side));
}

TEST(analysis_analyze, each_analysis_reduces_every_stage_once) {
  WorkerPipeline w;
  graph::StageGraph g = graph::traverse(w.zip);

  std::size_t reductions = 0;
  analysis::AnalysisOptions options;
  options.onReduce = [&](const Stage &) { ++reductions; };
  options.verbose = true;

  (void)analysis::analyze(g, options);

  // cut point: zip, map, ph, rr, side. branches: zip, map, ph, side.
  EXPECT_EQ(reductions, 9u);
}

TEST(analysis_analyze, formats_the_plan) {
  WorkerPipeline w;
  graph::StageGraph g = graph::traverse(w.zip);

  analysis::DispatchPlan plan = analysis::analyze(g);
  EXPECT_EQ(fmt::format("{}", plan), fmt::format("Cut point: {}\n"
                                                 "Replicable branches: [{}]",
                                                 idOf(g, w.rr),
                                                 idOf(g, w.side)));

  analysis::DispatchPlan empty;
  EXPECT_EQ(fmt::format("{}", empty),
            "Cut point: none\nReplicable branches: []");
}

TEST(analysis_analyze, logs_at_trace_level) {
  diag::set_log_level(diag::LogLevel::Trace);
  WorkerPipeline w;
  graph::StageGraph g = graph::traverse(w.zip);
  EXPECT_NO_THROW((void)analysis::analyze(g));
  diag::set_log_level(diag::LogLevel::Warn);
}

TEST(analysis_analyze, rejects_multiple_outputs) {
  WorkerPipeline w;
  const Stage *outputs[] = {&w.zip, &w.map};
  graph::StageGraph g = graph::traverse(outputs);

  EXPECT_THROW((void)analysis::analyze(g), diag::InvalidGraphShape);
}

TEST(analysis_analyze, rejects_zero_outputs) {
  graph::StageGraph g = graph::traverse(memory::span<const Stage *const>());
  try {
    (void)analysis::analyze(g);
    FAIL() << "expected InvalidGraphShape";
  } catch (const diag::InvalidGraphShape &e) {
    EXPECT_EQ(e.rootCount(), 0u);
  }
}

#include "evaluator.hpp"
#include "solver/als.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <string>
#include <vector>

namespace {

// records how often the solver asks for each metric
class CountingEvaluator : public Evaluator {
public:
    int n_evaluate = 0, n_auc = 0;

    void evaluate(const Model&) override { ++n_evaluate; }
    void evaluateAUC(const Model&) override { ++n_auc; }
    bool load_file(const InteractionMatrix&, const std::string&, const std::vector<int>&) override { return true; }
};

std::vector<interaction> grid_records() {
    std::vector<interaction> records;
    for (int uid = 0; uid < 6; ++uid) {
        for (int iid = 0; iid < 5; ++iid) {
            if ((uid + iid) % 2 == 0) records.push_back(interaction(uid, iid, 1.));
        }
    }
    return records;
}

}  // namespace

class EvaluatorBinaryTest : public ::testing::Test {
protected:
    void SetUp() override {
        // rank 1: both users prefer items in the order 0 > 1 > 2
        model.allocate(2, 3);
        model.U[0] = 1.; model.U[1] = 1.;
        model.V[0] = 3.; model.V[1] = 2.; model.V[2] = 1.;

        std::vector<interaction> records;
        records.push_back(interaction(0, 0, 1.));
        train = InteractionMatrix::build(records, 2, 3);

        held_out.push_back(interaction(0, 1, 1.));
        held_out.push_back(interaction(1, 2, 1.));

        k.push_back(2);
        k.push_back(1);
    }

    Model model{1};
    InteractionMatrix train;
    std::vector<interaction> held_out;
    std::vector<int> k;
};

TEST_F(EvaluatorBinaryTest, PrecisionAtK) {
    EvaluatorBinary eval;
    eval.set_data(train, held_out, k);
    EXPECT_EQ(eval.k_max, 2);

    eval.evaluate(model);
    ASSERT_EQ(eval.precision.size(), 2u);
    // user 0 hits item 1 at rank 1, user 1 misses item 2 in its top 2
    EXPECT_DOUBLE_EQ(eval.precision[0], .5);
    EXPECT_DOUBLE_EQ(eval.precision[1], .25);
}

TEST_F(EvaluatorBinaryTest, AUC) {
    EvaluatorBinary eval;
    eval.set_data(train, held_out, k);

    eval.evaluateAUC(model);
    // user 0 ranks its held-out item above the only negative, user 1 below both
    EXPECT_DOUBLE_EQ(eval.auc, .5);
}

TEST_F(EvaluatorBinaryTest, QuietWhenNotVerbose) {
    EvaluatorBinary eval;
    eval.verbose = false;
    eval.set_data(train, held_out, k);

    ::testing::internal::CaptureStdout();
    eval.evaluate(model);
    eval.evaluateAUC(model);
    std::string out = ::testing::internal::GetCapturedStdout();

    EXPECT_TRUE(out.empty()) << out;
    EXPECT_DOUBLE_EQ(eval.precision[0], .5);
    EXPECT_DOUBLE_EQ(eval.auc, .5);
}

TEST_F(EvaluatorBinaryTest, IgnoresUnknownIds) {
    held_out.push_back(interaction(7, 0, 1.));
    held_out.push_back(interaction(0, 9, 1.));

    EvaluatorBinary eval;
    eval.set_data(train, held_out, k);
    ASSERT_EQ(eval.test.size(), 2u);
    EXPECT_EQ(eval.test[0].size(), 1u);

    eval.evaluate(model);
    EXPECT_DOUBLE_EQ(eval.precision[0], .5);
}

TEST_F(EvaluatorBinaryTest, LoadFile) {
    std::string path = ::testing::TempDir() + "implicitrec_test_pairs.txt";
    {
        std::ofstream f(path);
        f << "0 1\n1 2\n";
    }

    EvaluatorBinary eval;
    ASSERT_TRUE(eval.load_file(train, path, k));
    EXPECT_EQ(eval.test[0].count(1), 1u);
    EXPECT_EQ(eval.test[1].count(2), 1u);

    EXPECT_FALSE(eval.load_file(train, ::testing::TempDir() + "implicitrec_no_pairs.txt", k));
}

TEST(EvaluatorSolverTest, RunsEveryIteration) {
    std::vector<interaction> records;
    std::vector<interaction> held_out;
    for (int uid = 0; uid < 10; ++uid) {
        for (int iid = 0; iid < 8; ++iid) {
            if ((uid + iid) % 3 == 0) records.push_back(interaction(uid, iid, 1.));
            else if ((uid + iid) % 5 == 0) held_out.push_back(interaction(uid, iid, 1.));
        }
    }

    Problem prob(.1, 40.);
    prob.set_data(records, 10, 8);
    Model model(3);

    std::vector<int> k;
    k.push_back(1);
    k.push_back(5);
    EvaluatorBinary eval;
    eval.verbose = false;
    eval.set_data(prob.train, held_out, k);

    SolverALS solver(3, 2, 9);
    solver.verbose = false;

    ::testing::internal::CaptureStdout();
    solver.solve(prob, model, &eval);
    EXPECT_TRUE(::testing::internal::GetCapturedStdout().empty());

    ASSERT_EQ(eval.precision.size(), 2u);
    EXPECT_GE(eval.precision[0], 0.);
    EXPECT_LE(eval.precision[0], 1.);
    EXPECT_GE(eval.auc, 0.);
    EXPECT_LE(eval.auc, 1.);
}

TEST(EvaluatorSolverTest, EveryRowReportsBothMetrics) {
    Problem prob(.1, 40.);
    prob.set_data(grid_records(), 6, 5);
    Model model(2);

    CountingEvaluator eval;
    SolverALS solver(4, 1, 3);
    solver.verbose = false;
    solver.solve(prob, model, &eval);

    // the initial row plus one per iteration
    EXPECT_EQ(eval.n_evaluate, 5);
    EXPECT_EQ(eval.n_auc, 5);
}

/**
 * @file test_parameter_space_mapper.cpp
 * @brief Tests for active/full joint vector mapping and bounds reduction
 */

#include <gtest/gtest.h>
#include "ik/ParameterSpaceMapper.hpp"
#include "ik/BoundsAdapter.hpp"
#include "TestChains.hpp"

using namespace chain_ik::ik;
using chain_ik::InvalidArgumentError;
using chain_ik::kinematics::JointBounds;
using chain_ik::kinematics::JointType;
using chain_ik::kinematics::Link;
using chain_ik::kinematics::Vector3d;

class ParameterSpaceMapperTest : public ::testing::Test {
protected:
    // Non-contiguous mask: links 1 and 3 active
    ParameterSpaceMapper mapper_{std::vector<bool>{false, true, false, true, false}};
};

// ============================================================================
// Mapping
// ============================================================================

TEST_F(ParameterSpaceMapperTest, Sizes) {
    EXPECT_EQ(mapper_.fullSize(), 5u);
    EXPECT_EQ(mapper_.activeSize(), 2u);
    EXPECT_EQ(mapper_.activeIndices(), (std::vector<size_t>{1, 3}));
}

TEST_F(ParameterSpaceMapperTest, ReduceKeepsActiveOrder) {
    JointVector full(5);
    full << 10, 11, 12, 13, 14;
    JointVector active = mapper_.reduce(full);
    ASSERT_EQ(active.size(), 2);
    EXPECT_DOUBLE_EQ(active[0], 11);
    EXPECT_DOUBLE_EQ(active[1], 13);
}

TEST_F(ParameterSpaceMapperTest, MergeOverwritesOnlyActive) {
    JointVector full(5);
    full << 10, 11, 12, 13, 14;
    JointVector active(2);
    active << -1, -3;

    JointVector merged = mapper_.merge(active, full);
    JointVector expected(5);
    expected << 10, -1, 12, -3, 14;
    EXPECT_TRUE(merged.isApprox(expected));

    // Input left untouched
    EXPECT_DOUBLE_EQ(full[1], 11);
}

TEST_F(ParameterSpaceMapperTest, MergeOfReduceIsIdentity) {
    JointVector full(5);
    full << 0.5, -0.25, 3.0, 1e-9, -7.0;
    EXPECT_TRUE(mapper_.merge(mapper_.reduce(full), full).isApprox(full));
}

TEST_F(ParameterSpaceMapperTest, ReduceOfMergeIsIdentity) {
    JointVector full(5);
    full << 10, 11, 12, 13, 14;
    JointVector active(2);
    active << 0.3, -0.2;

    JointVector merged = mapper_.merge(active, full);
    JointVector back = mapper_.reduce(merged);
    ASSERT_EQ(back.size(), 2);
    EXPECT_DOUBLE_EQ(back[0], 0.3);
    EXPECT_DOUBLE_EQ(back[1], -0.2);
}

TEST_F(ParameterSpaceMapperTest, GenericReduceOnNames) {
    std::vector<std::string> names = {"a", "b", "c", "d", "e"};
    EXPECT_EQ(mapper_.reduce(names), (std::vector<std::string>{"b", "d"}));
}

TEST_F(ParameterSpaceMapperTest, SizeMismatchThrows) {
    EXPECT_THROW(mapper_.reduce(JointVector::Zero(4)), InvalidArgumentError);
    EXPECT_THROW(mapper_.merge(JointVector::Zero(3), JointVector::Zero(5)), InvalidArgumentError);
    EXPECT_THROW(mapper_.merge(JointVector::Zero(2), JointVector::Zero(6)), InvalidArgumentError);
    EXPECT_THROW(mapper_.reduce(std::vector<int>{1, 2}), InvalidArgumentError);
}

TEST(ParameterSpaceMapper, NoActiveLinks) {
    ParameterSpaceMapper mapper(std::vector<bool>{false, false});
    JointVector full(2);
    full << 1, 2;
    EXPECT_EQ(mapper.reduce(full).size(), 0);
    EXPECT_TRUE(mapper.merge(JointVector(), full).isApprox(full));
}

TEST(ParameterSpaceMapper, FromChainMask) {
    auto chain = chain_ik::test_support::makePlanarArm(3);
    ParameterSpaceMapper mapper(chain);
    EXPECT_EQ(mapper.fullSize(), 5u);
    EXPECT_EQ(mapper.activeIndices(), (std::vector<size_t>{1, 2, 3}));
}

TEST(ParameterSpaceMapper, ChainReduceOfMergeIsIdentity) {
    // Fixed link between the two joints leaves a gap in the mask
    std::vector<Link> links = {
        Link::fixed("base"),
        Link("j1", JointType::Revolute, Vector3d::Zero(), Vector3d::Zero(), Vector3d::UnitZ(),
             JointBounds(-1.0, 1.0)),
        Link::fixed("spacer", Vector3d(0.5, 0, 0)),
        Link("j2", JointType::Revolute, Vector3d(0.5, 0, 0), Vector3d::Zero(), Vector3d::UnitZ(),
             JointBounds(0.0, 2.0)),
        Link::fixed("tip", Vector3d(1, 0, 0)),
    };
    chain_ik::kinematics::Chain chain(links);
    ParameterSpaceMapper mapper(chain);
    ASSERT_EQ(mapper.activeIndices(), (std::vector<size_t>{1, 3}));

    JointVector active(2);
    active << -0.75, 1.5;
    ASSERT_TRUE(withinBounds(active, reduceBounds(chain)));

    JointVector full = chain.zeroConfiguration();
    full[2] = 9.0;
    JointVector merged = mapper.merge(active, full);
    EXPECT_TRUE(mapper.reduce(merged).isApprox(active));
    EXPECT_DOUBLE_EQ(merged[2], 9.0);
}

// ============================================================================
// Bounds
// ============================================================================

class BoundsAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::vector<Link> links = {
            Link::fixed("base"),
            Link("j1", JointType::Revolute, Vector3d::Zero(), Vector3d::Zero(), Vector3d::UnitZ(),
                 JointBounds(-1.0, 1.0)),
            Link("j2", JointType::Revolute, Vector3d(1, 0, 0)),
            Link("j3", JointType::Prismatic, Vector3d(1, 0, 0), Vector3d::Zero(), Vector3d::UnitX(),
                 JointBounds(std::nullopt, 0.5)),
            Link::fixed("tip", Vector3d(1, 0, 0)),
        };
        chain_ = std::make_unique<chain_ik::kinematics::Chain>(links);
    }

    std::unique_ptr<chain_ik::kinematics::Chain> chain_;
};

TEST_F(BoundsAdapterTest, CollectsOnePairPerLink) {
    auto bounds = collectBounds(*chain_);
    ASSERT_EQ(bounds.size(), 5u);
    EXPECT_FALSE(bounds[0].isBounded());
    EXPECT_EQ(bounds[1], JointBounds(-1.0, 1.0));
}

TEST_F(BoundsAdapterTest, ReduceKeepsUnboundedSentinel) {
    auto bounds = reduceBounds(*chain_);
    ASSERT_EQ(bounds.size(), 3u);

    EXPECT_EQ(bounds[0], JointBounds(-1.0, 1.0));

    // Missing limits stay missing, they are not replaced by numbers
    EXPECT_FALSE(bounds[1].lower.has_value());
    EXPECT_FALSE(bounds[1].upper.has_value());

    EXPECT_FALSE(bounds[2].lower.has_value());
    ASSERT_TRUE(bounds[2].upper.has_value());
    EXPECT_DOUBLE_EQ(*bounds[2].upper, 0.5);
}

TEST_F(BoundsAdapterTest, WithinBounds) {
    auto bounds = reduceBounds(*chain_);

    JointVector inside(3);
    inside << 0.5, 100.0, -50.0;
    EXPECT_TRUE(withinBounds(inside, bounds));

    JointVector outside(3);
    outside << 1.2, 0.0, 0.0;
    EXPECT_FALSE(withinBounds(outside, bounds));
    EXPECT_TRUE(withinBounds(outside, bounds, 0.25));

    EXPECT_FALSE(withinBounds(JointVector::Zero(2), bounds));
}

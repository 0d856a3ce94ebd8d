#include <facelens/core/error.hpp>
#include <gtest/gtest.h>

namespace fc = facelens::core;

TEST(PipelineError, ToString) {
  EXPECT_EQ(fc::to_string(fc::PipelineError::None), "None");
  EXPECT_EQ(fc::to_string(fc::PipelineError::InvalidFrame), "InvalidFrame");
  EXPECT_EQ(fc::to_string(fc::PipelineError::InferenceFailure), "InferenceFailure");
  EXPECT_EQ(fc::to_string(fc::PipelineError::DegenerateGeometry), "DegenerateGeometry");
  EXPECT_EQ(fc::to_string(fc::PipelineError::ResourceUnavailable), "ResourceUnavailable");
  EXPECT_EQ(fc::to_string(fc::PipelineError::InvalidConfig), "InvalidConfig");
  EXPECT_EQ(fc::to_string(fc::PipelineError::StaleResult), "StaleResult");
}

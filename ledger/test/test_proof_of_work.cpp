// <cmath> declares ::pow; project headers must coexist with it in any order
#include <cmath>
#include "../ProofOfWork.h"
#include "../../lib/Utilities.h"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>

using namespace powledger;

TEST(ProofOfWorkTest, DefaultDifficultyIsFour) {
  ProofOfWork pow;
  EXPECT_EQ(pow.getDifficulty(), 4u);
}

TEST(ProofOfWorkTest, SolveProducesVerifiableProof) {
  ProofOfWork pow;
  auto proof = pow.solve(100);
  ASSERT_TRUE(proof.isOk());
  EXPECT_TRUE(pow.verify(100, proof.value()));

  std::string digest = utl::sha256("100" + std::to_string(proof.value()));
  EXPECT_EQ(digest.substr(0, 4), "0000");
}

TEST(ProofOfWorkTest, SolveReturnsSmallestProof) {
  ProofOfWork pow(2);
  auto proof = pow.solve(7);
  ASSERT_TRUE(proof.isOk());
  for (uint64_t candidate = 0; candidate < proof.value(); ++candidate) {
    EXPECT_FALSE(pow.verify(7, candidate));
  }
}

TEST(ProofOfWorkTest, VerifyDependsOnLastProof) {
  ProofOfWork pow(3);
  auto proof = pow.solve(12345);
  ASSERT_TRUE(proof.isOk());

  std::string digest = utl::sha256("12346" + std::to_string(proof.value()));
  EXPECT_EQ(pow.verify(12346, proof.value()), digest.substr(0, 3) == "000");
}

TEST(ProofOfWorkTest, ZeroDifficultyAcceptsEverything) {
  ProofOfWork pow(0);
  EXPECT_TRUE(pow.verify(1, 1));
  auto proof = pow.solve(42);
  ASSERT_TRUE(proof.isOk());
  EXPECT_EQ(proof.value(), 0u);
}

TEST(ProofOfWorkTest, AcceptanceRateMatchesDifficulty) {
  // With difficulty 1 roughly one candidate in 16 passes
  ProofOfWork pow(1);
  int accepted = 0;
  const int trials = 16000;
  for (int i = 0; i < trials; ++i) {
    if (pow.verify(100, static_cast<uint64_t>(i))) {
      ++accepted;
    }
  }
  EXPECT_GT(accepted, 800);
  EXPECT_LT(accepted, 1200);
}

TEST(ProofOfWorkTest, ExpectedRateFollowsHexDigitDifficulty) {
  ProofOfWork proofOfWork(2);
  double expected = ::pow(16.0, -static_cast<double>(proofOfWork.getDifficulty()));
  EXPECT_DOUBLE_EQ(expected, std::pow(16.0, -2.0));

  int accepted = 0;
  const int trials = 25600;
  for (int i = 0; i < trials; ++i) {
    if (proofOfWork.verify(7, static_cast<uint64_t>(i))) {
      ++accepted;
    }
  }
  EXPECT_NEAR(accepted, expected * trials, 50);
}

TEST(ProofOfWorkTest, PreCancelledSearchStopsImmediately) {
  ProofOfWork pow;
  std::atomic<bool> cancel{ true };
  auto proof = pow.solve(100, &cancel);
  ASSERT_TRUE(proof.isError());
  EXPECT_EQ(proof.error().code, ProofOfWork::E_CANCELLED);
}

TEST(ProofOfWorkTest, CancelStopsRunningSearch) {
  // Difficulty 12 is out of reach within the test's lifetime
  ProofOfWork pow(12);
  std::atomic<bool> cancel{ false };

  ProofOfWork::Roe<uint64_t> result = ProofOfWork::Error(0, "not run");
  std::thread worker([&]() { result = pow.solve(100, &cancel); });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  cancel = true;
  worker.join();

  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, ProofOfWork::E_CANCELLED);
}

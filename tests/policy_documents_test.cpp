// =============================================================================
// policy_documents_test.cpp
// =============================================================================
// Loading and schema validation of the claim taxonomy and source precedence
// documents, including the copies shipped under policy/.
// =============================================================================

#include "zkr/policy/policy_documents.hpp"
#include "zkr/policy/policy_engine.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

using zkr::policy::PolicyDocumentError;

TEST(PolicyDocumentsTest, DefaultsPassValidation) {
  EXPECT_NO_THROW(zkr::policy::validateClaimTaxonomy(
      zkr::policy::defaultClaimTaxonomy()));
  EXPECT_NO_THROW(zkr::policy::validateSourcePrecedence(
      zkr::policy::defaultSourcePrecedence()));
}

// -----------------------------------------------------------------------------
// The files shipped in policy/ are the same documents as the built-ins.
// -----------------------------------------------------------------------------
TEST(PolicyDocumentsTest, ShippedFilesMatchDefaults) {
  const std::string dir = ZKR_POLICY_DIR;

  auto taxonomy = zkr::policy::loadPolicyDocument(dir + "/claim-taxonomy.json");
  auto precedence =
      zkr::policy::loadPolicyDocument(dir + "/source-precedence.json");

  EXPECT_EQ(taxonomy, zkr::policy::defaultClaimTaxonomy());
  EXPECT_EQ(precedence, zkr::policy::defaultSourcePrecedence());

  auto engine = zkr::policy::PolicyEngine::fromDirectory(dir);
  EXPECT_EQ(engine.sourcePrecedenceVersion(), "source-precedence-v0.1.0");
}

TEST(PolicyDocumentsTest, MissingFileNamesPath) {
  try {
    zkr::policy::loadPolicyDocument("/nonexistent/claim-taxonomy.json");
    FAIL() << "expected PolicyDocumentError";
  } catch (const PolicyDocumentError& e) {
    EXPECT_NE(std::string(e.what()).find("/nonexistent/claim-taxonomy.json"),
              std::string::npos);
  }
}

TEST(PolicyDocumentsTest, MalformedJsonIsRejected) {
  const std::string path = ::testing::TempDir() + "zkr_malformed_policy.json";
  {
    std::ofstream out(path);
    out << "{ \"version\": ";
  }
  EXPECT_THROW(zkr::policy::loadPolicyDocument(path), PolicyDocumentError);
  std::remove(path.c_str());
}

TEST(PolicyDocumentsTest, TaxonomyRequiresBothClaimTypes) {
  auto doc = zkr::policy::defaultClaimTaxonomy();
  doc["claim_types"].erase("TRADE_EXECUTED");
  EXPECT_THROW(zkr::policy::validateClaimTaxonomy(doc), PolicyDocumentError);
}

TEST(PolicyDocumentsTest, TaxonomyTagsMustBeStrings) {
  auto doc = zkr::policy::defaultClaimTaxonomy();
  doc["claim_types"]["ORDER_PLACED"]["required_evidence_tags_all"] =
      nlohmann::json::array({"order_identity", 7});
  EXPECT_THROW(zkr::policy::validateClaimTaxonomy(doc), PolicyDocumentError);
}

// -----------------------------------------------------------------------------
// Reason codes must be exactly the eight known codes: none missing, none
// extra, no duplicates.
// -----------------------------------------------------------------------------
TEST(PolicyDocumentsTest, TaxonomyReasonCodesMustBeExact) {
  auto missing = zkr::policy::defaultClaimTaxonomy();
  missing["non_provable_reason_codes"].erase(0);
  EXPECT_THROW(zkr::policy::validateClaimTaxonomy(missing), PolicyDocumentError);

  auto extra = zkr::policy::defaultClaimTaxonomy();
  extra["non_provable_reason_codes"].push_back("RATE_LIMITED");
  EXPECT_THROW(zkr::policy::validateClaimTaxonomy(extra), PolicyDocumentError);

  auto duplicate = zkr::policy::defaultClaimTaxonomy();
  duplicate["non_provable_reason_codes"].push_back("EVIDENCE_MISSING");
  EXPECT_THROW(zkr::policy::validateClaimTaxonomy(duplicate),
               PolicyDocumentError);
}

TEST(PolicyDocumentsTest, PrecedenceRequiresVersionAndAllVenues) {
  auto no_version = zkr::policy::defaultSourcePrecedence();
  no_version.erase("version");
  EXPECT_THROW(zkr::policy::validateSourcePrecedence(no_version),
               PolicyDocumentError);

  auto no_solana = zkr::policy::defaultSourcePrecedence();
  no_solana["venues"].erase("solana");
  EXPECT_THROW(zkr::policy::validateSourcePrecedence(no_solana),
               PolicyDocumentError);

  auto missing_list = zkr::policy::defaultSourcePrecedence();
  missing_list["venues"]["base"].erase("trade_executed_sources_preferred");
  EXPECT_THROW(zkr::policy::validateSourcePrecedence(missing_list),
               PolicyDocumentError);
}

TEST(PolicyDocumentsTest, PrecedenceRejectsUnknownVenue) {
  auto doc = zkr::policy::defaultSourcePrecedence();
  doc["venues"]["binance"] = doc["venues"]["base"];
  EXPECT_THROW(zkr::policy::validateSourcePrecedence(doc), PolicyDocumentError);
}

TEST(PolicyDocumentsTest, EngineConstructionValidates) {
  auto doc = zkr::policy::defaultSourcePrecedence();
  doc["venues"].erase("hyperliquid");
  EXPECT_THROW(zkr::policy::PolicyEngine(zkr::policy::defaultClaimTaxonomy(), doc),
               PolicyDocumentError);
}

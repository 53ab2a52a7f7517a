/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include <gtest/gtest.h>

#include "alternative_genes.hpp"
#include "test_helpers.hpp"

class AlternativeGenesTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::add_reference(index, "a1", "geneA", {{0, 100}});
        test::add_reference(index, "b1", "geneB", {{0, 60}});
        test::add_reference(index, "c1", "geneC", {{0, 70}}, false);
        test::add_reference(index, "e1", "geneE", {{0, 20}}, false);
        test::add_denovo(index, "d1", {{0, 100}});
    }

    std::set<std::string> collect(const std::vector<exon_conflict>& conflicts,
                                  const std::optional<std::string>& assigned) {
        auto part = test::make_partition(index, {
            test::make_entry(1, "a1", transcript_source::UNFILTERED_REFERENCE),
            test::make_entry(1, "b1", transcript_source::UNFILTERED_REFERENCE),
            test::make_entry(1, "c1", transcript_source::UNFILTERED_REFERENCE),
            test::make_entry(1, "e1", transcript_source::UNFILTERED_REFERENCE),
            test::make_entry(1, "d1", transcript_source::DENOVO, conflicts),
        });
        const auto& denovo = index.at(transcript_source::DENOVO, "d1");
        auto candidates = exon_conflict_resolver::resolve(part, denovo);
        gene_resolver resolver(index);
        return alternative_genes::collect(resolver, denovo, part, candidates, assigned);
    }

    transcript_index index;
};

TEST_F(AlternativeGenesTest, WithoutConflictsUsesUnfilteredOnlyGenes) {
    // geneE overlaps too little
    EXPECT_EQ(collect({}, std::string("geneA")), (std::set<std::string>{"geneC"}));
}

TEST_F(AlternativeGenesTest, WithConflictsUsesCandidateTranscriptGenes) {
    auto alternatives = collect({{transcript_source::DENOVO, "d2"}}, std::string("geneA"));
    EXPECT_EQ(alternatives, (std::set<std::string>{"geneB"}));
}

TEST_F(AlternativeGenesTest, AssignedGeneIsNeverAnAlternative) {
    auto alternatives = collect({{transcript_source::DENOVO, "d2"}}, std::string("geneB"));
    EXPECT_EQ(alternatives, (std::set<std::string>{"geneA"}));
}

TEST_F(AlternativeGenesTest, UnassignedKeepsAllQualifyingGenes) {
    auto alternatives = collect({{transcript_source::DENOVO, "d2"}}, std::nullopt);
    EXPECT_EQ(alternatives, (std::set<std::string>{"geneA", "geneB"}));
}

// ============================================================================
// adjust_method
// ============================================================================

TEST(AlternativeGenesMethod, RescuedWithoutAlternativesIsCleared) {
    EXPECT_EQ(alternative_genes::adjust_method(resolution_method::RESCUED, {}), std::nullopt);
    EXPECT_EQ(alternative_genes::adjust_method(resolution_method::AMBIGUOUS_OR_FUSION, {}),
              std::nullopt);
}

TEST(AlternativeGenesMethod, BadAnnotationIsKept) {
    EXPECT_EQ(alternative_genes::adjust_method(resolution_method::BAD_ANNOT_OR_TM, {}),
              resolution_method::BAD_ANNOT_OR_TM);
}

TEST(AlternativeGenesMethod, MethodKeptWhenAlternativesExist) {
    std::set<std::string> alternatives = {"geneX"};
    EXPECT_EQ(alternative_genes::adjust_method(resolution_method::RESCUED, alternatives),
              resolution_method::RESCUED);
    EXPECT_EQ(alternative_genes::adjust_method(std::nullopt, alternatives), std::nullopt);
}

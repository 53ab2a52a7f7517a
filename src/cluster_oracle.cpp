/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "cluster_oracle.hpp"

#include "cluster_genes_runner.hpp"
#include "grove_clusterer.hpp"

std::unique_ptr<cluster_oracle> cluster_oracle::create(const std::string& name,
                                                      const std::string& executable,
                                                      int order) {
    if (name == "clusterGenes") {
        return std::make_unique<cluster_genes_runner>(executable);
    }
    if (name == "grove") {
        return std::make_unique<grove_clusterer>(order);
    }
    throw std::runtime_error("Unknown clustering oracle: " + name +
                             " (expected 'clusterGenes' or 'grove')");
}

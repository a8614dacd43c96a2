#ifndef RKG_RKG_HPP
#define RKG_RKG_HPP

/**
 * @file rkg.hpp
 * @brief Main header for the Repository Knowledge Graph library.
 *
 * Pulls in the scan, persistence and search entry points. Include the
 * specific headers for narrower dependencies.
 */

#include "rkg/version.hpp"
#include "rkg/error.hpp"
#include "rkg/result.hpp"
#include "rkg/types.hpp"
#include "rkg/logging.hpp"
#include "rkg/config/config.hpp"
#include "rkg/graph/graph_builder.hpp"
#include "rkg/graph/knowledge_graph.hpp"
#include "rkg/graph/persistence.hpp"
#include "rkg/analyzers/complexity.hpp"
#include "rkg/search/embedding_index.hpp"
#include "rkg/search/index_store.hpp"
#include "rkg/search/search_engine.hpp"

#endif  // RKG_RKG_HPP

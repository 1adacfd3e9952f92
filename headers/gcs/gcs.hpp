//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef GCS_GCS_HPP
#define GCS_GCS_HPP

/**
 * @file gcs.hpp
 * @brief Main header for the contribution statistics library.
 *
 * Pulls in the public API needed to build and query a statistics table.
 * Include specific headers for narrower dependencies.
 */

#include "version.hpp"
#include "error.hpp"
#include "result.hpp"
#include "types.hpp"
#include "log.hpp"
#include "git/repository.hpp"
#include "walk/cancellation.hpp"
#include "stats/statistics_table.hpp"
#include "stats/table_view.hpp"
#include "engine/statistics_engine.hpp"

#endif //GCS_GCS_HPP

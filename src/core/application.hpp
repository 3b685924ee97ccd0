#ifndef APPLICATION_HPP
#define APPLICATION_HPP

#include "core/config.hpp"

#include <ostream>

/**
 * One command-line run: configures logging, analyzes the configured sample
 * data and writes the text report or the JSON document to `out`.
 *
 * With JSON output selected, log lines go to stderr so that stdout carries
 * nothing but the document.
 *
 * @return process exit code (1 when the engine cannot be set up)
 */
int run_application(const Config::AppConfig &config, std::ostream &out);

#endif // APPLICATION_HPP

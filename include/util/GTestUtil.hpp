#pragma once

#include <gtest/gtest.h>

/*
 * Dispatches to the standard gtest main function, while also accepting the LoggingUtil cmdline
 * params. Every unit-test executable ends with:
 *
 * int main(int argc, char** argv) { return launch_gtest(argc, argv); }
 */
int launch_gtest(int argc, char** argv);

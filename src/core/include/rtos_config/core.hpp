#pragma once
/**
 * @file core.hpp
 * @brief Main include file for the application description parser
 */

#include "logging/Logger.hpp"
#include "syntax/Lexer.hpp"
#include "syntax/TokenPrinter.hpp"
#include "parser/AST.hpp"
#include "parser/Parser.hpp"
#include "config/ConfigManager.hpp"

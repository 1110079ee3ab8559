/**
 * @file UVLErrorListener.hh
 * @brief ANTLR error listener that turns syntax errors into MalformedModelError
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#ifndef UVLERRORLISTENER_H
#define UVLERRORLISTENER_H

#include "ModelErrors.hh"
#include "antlr4-runtime.h"

#include <string>

/**
 * @class UVLErrorListener
 * @brief Aborts lexing/parsing on the first syntax error
 *
 * Installed on both the lexer and the parser in place of the default console
 * listener, so a malformed model never yields a partial parse tree.
 */
class UVLErrorListener : public antlr4::BaseErrorListener {
public:
    void syntaxError(antlr4::Recognizer* recognizer,
                     antlr4::Token* offendingSymbol,
                     size_t line,
                     size_t charPositionInLine,
                     const std::string& msg,
                     std::exception_ptr e) override {
        (void)recognizer;
        (void)offendingSymbol;
        (void)e;
        throw MalformedModelError(msg, line, charPositionInLine);
    }
};

#endif // UVLERRORLISTENER_H

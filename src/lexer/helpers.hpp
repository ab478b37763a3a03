#pragma once

#include "token.hpp"

namespace rollkit::lexer::helpers {

int isdigit_(int curr);
int isalpha_(int curr);
int isalnum_(int curr);

/**
 * @brief Checks whether a token can end an operand, so that letters after it
 * read as an operator keyword rather than an identifier.
 */
bool IsFollowsToken(TokenType curr_token);

bool IsWhitespace(int curr);
} // namespace rollkit::lexer::helpers

/**
 * Name: pyjudge::lex::TokenKind
 * Purpose: Token kinds for the submission lexer.
 * Theory of Operation: The screener only needs statement structure, imports
 *   and literals. Words and operators the parser never branches on share a
 *   kind (Keyword, Operator, AugAssign); Token::text keeps their spelling.
 */
#pragma once

namespace pyjudge::lex {

enum class TokenKind {
    End, // EOF
    Newline, // end of logical line
    Indent,
    Dedent,

    // keywords that shape statements
    Def,
    Class,
    Async,
    Import,
    From,
    As,
    If,
    Elif,
    Else,
    While,
    For,
    Try,
    Except,
    Finally,
    With,
    Lambda,
    Keyword, // any other reserved word: return, pass, not, in, yield, ...

    // punctuation the parser inspects
    LParen,
    RParen,
    LBracket,
    RBracket,
    LBrace,
    RBrace,
    Colon,
    ColonEqual, // := never ends a compound header
    Comma,
    Dot,
    Semicolon,
    At, // decorator (matrix-multiply in expressions)
    Equal,
    AugAssign, // +=, //=, >>=, ...
    Plus,
    Minus,
    Star,
    StarStar,
    Operator, // any other operator: ==, ->, <<, ~, ...

    Ident, // identifier (soft keywords match/case/type included)
    Int,
    Float,
    Imag, // 1j
    String, // str literal, any prefix but b
    Bytes, // b'...'
    BoolLit, // True/False
    NoneLit, // None
    Ellipsis // ...
};

// Human-readable name used in parser diagnostics ("'def'", "identifier").
const char* to_string(TokenKind k);

} // namespace pyjudge::lex

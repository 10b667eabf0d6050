/**
 * Name: pyjudge::lex::to_string(TokenKind)
 * Purpose: Diagnostic names for token kinds.
 */
#include "lexer/TokenKind.h"

namespace pyjudge::lex {
    const char *to_string(const TokenKind k) {
        using enum pyjudge::lex::TokenKind;
        switch (k) {
            case End: return "end of input";
            case Newline: return "newline";
            case Indent: return "indent";
            case Dedent: return "dedent";
            case Def: return "'def'";
            case Class: return "'class'";
            case Async: return "'async'";
            case Import: return "'import'";
            case From: return "'from'";
            case As: return "'as'";
            case If: return "'if'";
            case Elif: return "'elif'";
            case Else: return "'else'";
            case While: return "'while'";
            case For: return "'for'";
            case Try: return "'try'";
            case Except: return "'except'";
            case Finally: return "'finally'";
            case With: return "'with'";
            case Lambda: return "'lambda'";
            case Keyword: return "keyword";
            case LParen: return "'('";
            case RParen: return "')'";
            case LBracket: return "'['";
            case RBracket: return "']'";
            case LBrace: return "'{'";
            case RBrace: return "'}'";
            case Colon: return "':'";
            case ColonEqual: return "':='";
            case Comma: return "','";
            case Dot: return "'.'";
            case Semicolon: return "';'";
            case At: return "'@'";
            case Equal: return "'='";
            case AugAssign: return "augmented assignment";
            case Plus: return "'+'";
            case Minus: return "'-'";
            case Star: return "'*'";
            case StarStar: return "'**'";
            case Operator: return "operator";
            case Ident: return "identifier";
            case Int: return "integer literal";
            case Float: return "float literal";
            case Imag: return "imaginary literal";
            case String: return "string literal";
            case Bytes: return "bytes literal";
            case BoolLit: return "boolean literal";
            case NoneLit: return "'None'";
            case Ellipsis: return "'...'";
        }
        return "token";
    }
} // namespace pyjudge::lex

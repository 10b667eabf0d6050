#pragma once

#include "ast/Expressions.h"
#include "ast/Statements.h"

#pragma once

#include "builtins/character.hpp"
#include "builtins/collection.hpp"
#include "builtins/compare.hpp"
#include "builtins/domain.hpp"
#include "builtins/numeric.hpp"
#include "builtins/ops.hpp"
#include "builtins/option.hpp"
#include "builtins/predicate.hpp"
#include "builtins/string.hpp"
#include "builtins/unicode.hpp"
#include "declaration.hpp"
#include "error.hpp"
#include "newtype.hpp"
#include "pipeline.hpp"
#include "registry.hpp"
#include "sanitizer.hpp"
#include "untrusted.hpp"
#include "upgrade.hpp"
#include "validator.hpp"

#ifndef SEEN_TOCSEC_H
#define SEEN_TOCSEC_H

#include "classifier/chunk_resolver.hpp"
#include "classifier/toc_classifier.hpp"
#include "models/document_context.hpp"
#include "models/label_map.hpp"
#include "models/section_type.hpp"
#include "models/toc_entry.hpp"
#include "parser/toc_parser.hpp"
#include "rules/hierarchy.hpp"
#include "rules/keyword_locker.hpp"
#include "rules/sequence_rules.hpp"
#include "rules/validator.hpp"

#define TOCSEC_VERSION_MAJOR 1
#define TOCSEC_VERSION_MINOR 0

inline constexpr const char *kTocsecName = "tocsec";
inline constexpr const char *kTocsecVersion = "1.0.0";

#endif

#pragma once

#include <QString>

#include "models/ContextTypes.hpp"
#include "models/Result.hpp"

namespace marketbrief {

//! Consumer of the assembled context. Rendering and text generation live behind this seam.
class NarrativeGeneratorInterface {
public:
    virtual ~NarrativeGeneratorInterface() = default;

    virtual Result<QString> generate(const AggregatedContext& context, const QString& queryText,
                                     const QString& templateName) = 0;
};

} // namespace marketbrief

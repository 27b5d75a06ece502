#pragma once

#include <QString>
#include <QtGlobal>

namespace airsynth::util {

// Canonical deterministic string hash for parameter derivation.
//
// IMPORTANT:
// - Do NOT use qHash() for musical decisions (Qt seeds it per process).
// - Polynomial-31 over UTF-16 code units, wrapped to unsigned 32-bit.
//
// Hash versioning:
// - Bump kHashVersion only when you intentionally want different material for existing assets.
struct StableHash final {
    static constexpr quint32 kHashVersion = 1u;

    // h = h * 31 + codeUnit (mod 2^32).
    static quint32 poly31(const QString& text) {
        quint32 h = 0u;
        for (const QChar c : text) {
            h = h * 31u + quint32(c.unicode());
        }
        return h;
    }
};

} // namespace airsynth::util

#ifndef TESSERA_TEST_TOOLS_FAKES_H
#define TESSERA_TEST_TOOLS_FAKES_H

#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "tessera/source.h"
#include "tessera/status.h"

namespace Tessera {

/*
 * Source that produces its data in pieces of the given sizes, cycling through them. A source only has to
 * produce some of the requested bytes, so this simulates a stream that arrives in uneven bursts.
 */
class ScriptedSource : public Source {
public:
    ScriptedSource(std::string data, std::vector<Size> script);
    ~ScriptedSource() override = default;
    [[nodiscard]] auto read(Byte *out, Size &size) -> Status override;

    [[nodiscard]] auto read_count() const -> Size
    {
        return m_reads;
    }

private:
    std::string m_data;
    std::vector<Size> m_script;
    Size m_offset {};
    Size m_reads {};
};

// Source that produces its data normally for "good_reads" calls, then fails with a system_error status "42".
class FaultySource : public Source {
public:
    FaultySource(std::string data, Size good_reads);
    ~FaultySource() override = default;
    [[nodiscard]] auto read(Byte *out, Size &size) -> Status override;

private:
    std::string m_data;
    Size m_offset {};
    Size m_remaining {};
};

inline auto assert_error_42(const Status &s) -> testing::AssertionResult
{
    if (s.is_system_error() && s.what().to_string() == "42") {
        return testing::AssertionSuccess();
    }
    return testing::AssertionFailure() << "expected system error \"42\"";
}

} // namespace Tessera

#endif // TESSERA_TEST_TOOLS_FAKES_H

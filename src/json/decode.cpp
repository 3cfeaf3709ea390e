#include "json.h"
#include <vector>
#include "utils/utils.h"

namespace Tessera::Json {

namespace {

    // Builds a value tree from reader events. Only the innermost open structure is ever modified, so pointers
    // to the structures on the stack stay valid.
    class TreeBuilder : public Handler {
    public:
        ~TreeBuilder() override = default;

        [[nodiscard]] auto status() const -> const Status &
        {
            return m_status;
        }

        [[nodiscard]] auto root() -> Value &
        {
            return m_root;
        }

        [[nodiscard]] auto accept_key(const Slice &value) -> bool override
        {
            m_key = value.to_string();
            return true;
        }

        [[nodiscard]] auto accept_string(const Slice &value) -> bool override
        {
            add(value.to_string());
            return true;
        }

        [[nodiscard]] auto accept_number(const Slice &text) -> bool override
        {
            Decimal number;
            m_status = Decimal::parse(text, number);
            if (!m_status.is_ok()) {
                return false;
            }
            add(std::move(number));
            return true;
        }

        [[nodiscard]] auto accept_boolean(bool value) -> bool override
        {
            add(value);
            return true;
        }

        [[nodiscard]] auto accept_null() -> bool override
        {
            add(nullptr);
            return true;
        }

        [[nodiscard]] auto begin_object() -> bool override
        {
            m_stack.push_back(add(Value::Object {}));
            return true;
        }

        [[nodiscard]] auto end_object() -> bool override
        {
            TESSERA_EXPECT_FALSE(m_stack.empty());
            m_stack.pop_back();
            return true;
        }

        [[nodiscard]] auto begin_array() -> bool override
        {
            m_stack.push_back(add(Value::Array {}));
            return true;
        }

        [[nodiscard]] auto end_array() -> bool override
        {
            TESSERA_EXPECT_FALSE(m_stack.empty());
            m_stack.pop_back();
            return true;
        }

    private:
        auto add(Value value) -> Value *
        {
            if (m_stack.empty()) {
                m_root = std::move(value);
                return &m_root;
            }
            auto &parent = *m_stack.back();
            if (parent.is_array()) {
                auto &array = parent.as_array();
                array.emplace_back(std::move(value));
                return &array.back();
            }
            // A repeated key replaces the earlier value.
            auto &slot = parent.as_object()[m_key];
            slot = std::move(value);
            return &slot;
        }

        Status m_status {Status::ok()};
        std::vector<Value *> m_stack;
        std::string m_key;
        Value m_root;
    };

} // namespace

auto decode(const Slice &input, Value &out) -> Status
{
    TreeBuilder builder;
    Reader reader {builder};
    auto s = reader.read(input);
    if (s.is_ok() && !builder.status().is_ok()) {
        s = builder.status();
    }
    if (s.is_ok()) {
        out = std::move(builder.root());
    }
    return s;
}

} // namespace Tessera::Json

#include "json.h"
#include <spdlog/fmt/fmt.h>
#include <vector>
#include "utils/utils.h"

namespace Tessera::Json {

namespace {

    enum Event {
        EVENT_STRING,
        EVENT_NUMBER,
        EVENT_BOOLEAN,
        EVENT_NULL,
        EVENT_BEGIN_OBJECT,
        EVENT_END_OBJECT,
        EVENT_BEGIN_ARRAY,
        EVENT_END_ARRAY,
        EVENT_KEY,
    };

    enum Token {
        TOKEN_STRING = EVENT_STRING,
        TOKEN_NUMBER = EVENT_NUMBER,
        TOKEN_BOOLEAN = EVENT_BOOLEAN,
        TOKEN_NULL = EVENT_NULL,
        TOKEN_BEGIN_OBJECT = EVENT_BEGIN_OBJECT,
        TOKEN_END_OBJECT = EVENT_END_OBJECT,
        TOKEN_BEGIN_ARRAY = EVENT_BEGIN_ARRAY,
        TOKEN_END_ARRAY = EVENT_END_ARRAY,
        TOKEN_NAME_SEPARATOR,
        TOKEN_VALUE_SEPARATOR,
        TOKEN_ERROR,
        TOKEN_COUNT,
    };

    struct LexerValue {
        Slice text;
        bool boolean {};
    };

    inline auto is_json_space(char c) -> bool
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    }

    inline auto hex_value(char c) -> int
    {
        if (c >= '0' && c <= '9') {
            return c - '0';
        } else if (c >= 'a' && c <= 'f') {
            return c - 'a' + 10;
        } else if (c >= 'A' && c <= 'F') {
            return c - 'A' + 10;
        }
        return -1;
    }

    class Lexer {
    public:
        struct Position {
            Size line {1};
            Size column {};
        };

        explicit Lexer(const Slice &input)
            : m_end {input.data() + input.size()},
              m_itr {input.data()}
        {}

        [[nodiscard]] auto value() const -> const LexerValue &
        {
            return m_value;
        }

        [[nodiscard]] auto position() const -> const Position &
        {
            return m_pos;
        }

        [[nodiscard]] auto message() const -> const char *
        {
            return m_message;
        }

        // Returns false when the input is exhausted or an error was found. In the latter case, "token" is set to TOKEN_ERROR.
        [[nodiscard]] auto scan(Token &token) -> bool
        {
            do {
                get();
            } while (is_json_space(m_char));

            if (m_char == '\0' && is_empty()) {
                token = TOKEN_COUNT;
                return false;
            }
            switch (m_char) {
                case '"':
                    token = scan_string();
                    break;
                case '-':
                case '0':
                case '1':
                case '2':
                case '3':
                case '4':
                case '5':
                case '6':
                case '7':
                case '8':
                case '9':
                    token = scan_number();
                    break;
                case 'n':
                    token = scan_literal("null", TOKEN_NULL);
                    break;
                case 't':
                    m_value.boolean = true;
                    token = scan_literal("true", TOKEN_BOOLEAN);
                    break;
                case 'f':
                    m_value.boolean = false;
                    token = scan_literal("false", TOKEN_BOOLEAN);
                    break;
                case ':':
                    token = TOKEN_NAME_SEPARATOR;
                    break;
                case ',':
                    token = TOKEN_VALUE_SEPARATOR;
                    break;
                case '{':
                    token = TOKEN_BEGIN_OBJECT;
                    break;
                case '}':
                    token = TOKEN_END_OBJECT;
                    break;
                case '[':
                    token = TOKEN_BEGIN_ARRAY;
                    break;
                case ']':
                    token = TOKEN_END_ARRAY;
                    break;
                default:
                    token = make_error("unexpected character");
            }
            return token != TOKEN_ERROR;
        }

    private:
        [[nodiscard]] auto is_empty() const -> bool
        {
            return m_itr >= m_end;
        }

        [[nodiscard]] auto peek() const -> char
        {
            return is_empty() ? '\0' : *m_itr;
        }

        auto get() -> char
        {
            if (is_empty()) {
                m_char = '\0';
            } else {
                m_char = *m_itr++;
                if (m_char == '\n') {
                    m_pos.column = 0;
                    ++m_pos.line;
                } else {
                    ++m_pos.column;
                }
            }
            return m_char;
        }

        auto make_error(const char *message) -> Token
        {
            m_message = message;
            return TOKEN_ERROR;
        }

        auto get_codepoint() -> int
        {
            if (m_end - m_itr < 4) {
                return -1;
            }
            auto codepoint = 0;
            for (int i {}; i < 4; ++i) {
                const auto v = hex_value(get());
                if (v < 0) {
                    return -1;
                }
                codepoint = codepoint << 4 | v;
            }
            return codepoint;
        }

        auto append_codepoint(int codepoint) -> void
        {
            if (codepoint <= 0x7F) {
                m_scratch.push_back(static_cast<char>(codepoint));
            } else if (codepoint <= 0x7FF) {
                m_scratch.push_back(static_cast<char>(0xC0 | ((codepoint >> 6) & 0xFF)));
                m_scratch.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
            } else if (codepoint <= 0xFFFF) {
                m_scratch.push_back(static_cast<char>(0xE0 | ((codepoint >> 12) & 0xFF)));
                m_scratch.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
                m_scratch.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
            } else {
                TESSERA_EXPECT_LE(codepoint, 0x10FFFF);
                m_scratch.push_back(static_cast<char>(0xF0 | ((codepoint >> 18) & 0xFF)));
                m_scratch.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
                m_scratch.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
                m_scratch.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
            }
        }

        [[nodiscard]] auto scan_string() -> Token
        {
            // The scratch buffer is reused. The previous string is no longer needed once the handler has seen it.
            m_scratch.clear();
            for (;;) {
                if (is_empty()) {
                    return make_error("unterminated string");
                }
                switch (get()) {
                    case '\\':
                        switch (get()) {
                            case '\"':
                                m_scratch.push_back('\"');
                                break;
                            case '\\':
                                m_scratch.push_back('\\');
                                break;
                            case '/':
                                m_scratch.push_back('/');
                                break;
                            case 'b':
                                m_scratch.push_back('\b');
                                break;
                            case 'f':
                                m_scratch.push_back('\f');
                                break;
                            case 'n':
                                m_scratch.push_back('\n');
                                break;
                            case 'r':
                                m_scratch.push_back('\r');
                                break;
                            case 't':
                                m_scratch.push_back('\t');
                                break;
                            case 'u': {
                                auto codepoint = get_codepoint();
                                if (codepoint < 0) {
                                    return make_error("missing 4 hex digits after \"\\u\"");
                                }
                                if (0xD800 <= codepoint && codepoint <= 0xDFFF) {
                                    // A high surrogate (U+D800 to U+DBFF) must be followed by a low surrogate
                                    // (U+DC00 to U+DFFF).
                                    if (codepoint > 0xDBFF) {
                                        return make_error("missing high surrogate");
                                    }
                                    if (get() != '\\' || get() != 'u') {
                                        return make_error("missing low surrogate");
                                    }
                                    const auto low = get_codepoint();
                                    if (low < 0xDC00 || low > 0xDFFF) {
                                        return make_error("low surrogate is malformed");
                                    }
                                    codepoint = (((codepoint - 0xD800) << 10) | (low - 0xDC00)) + 0x10000;
                                }
                                append_codepoint(codepoint);
                                break;
                            }
                            default:
                                return make_error("unrecognized escape");
                        }
                        break;
                    case '"':
                        m_value.text = m_scratch;
                        return TOKEN_STRING;
                    default:
                        if (static_cast<unsigned char>(m_char) < 0x20) {
                            return make_error("unescaped control character in string");
                        }
                        m_scratch.push_back(m_char);
                }
            }
        }

        [[nodiscard]] auto scan_number() -> Token
        {
            // RFC 8259 number grammar:
            //     [ minus ] int [ frac ] [ exp ]
            // The number is only validated here. The text is handed over as it is so that no precision is lost.
            enum State {
                END,
                ERROR,
                BEGIN,
                FRAC,   // Read a '.' to start "frac" part
                DIGITS, // Read "frac" part digits
                EXP,    // Read an 'e' or 'E' to start "exp" part
                SIGN,   // Read a '+' or '-' in "exp" part
                POWER,  // Read "exp" part digits
                STATE_COUNT,
            } state = BEGIN;

            enum Class {
                DOT,   // .
                E,     // e or E
                PM,    // + or -
                DIGIT, // One of 0-9
                OTHER, // None of the above
                CLASS_COUNT,
            };

            static constexpr State TRANSITIONS[STATE_COUNT][CLASS_COUNT] = {
                //       Class = DOT,   E,     PM,    DIGIT,  OTHER
                /*    END */ {ERROR, ERROR, ERROR, ERROR, ERROR},
                /*  ERROR */ {ERROR, ERROR, ERROR, ERROR, ERROR},
                /*  BEGIN */ {FRAC, EXP, ERROR, ERROR, END},
                /*   FRAC */ {ERROR, ERROR, ERROR, DIGITS, ERROR},
                /* DIGITS */ {ERROR, EXP, ERROR, DIGITS, END},
                /*    EXP */ {ERROR, ERROR, SIGN, POWER, ERROR},
                /*   SIGN */ {ERROR, ERROR, ERROR, POWER, ERROR},
                /*  POWER */ {ERROR, ERROR, ERROR, POWER, END},
            };

            const auto *begin = m_itr - 1;
            if (m_char == '-' && !is_digit(get())) {
                return make_error("expected digit after '-'");
            }
            // m_char now holds the first digit of the "int" part.
            if (m_char == '0') {
                if (is_digit(peek())) {
                    return make_error("leading zero in number");
                }
            } else {
                while (is_digit(peek())) {
                    get();
                }
            }

            for (;;) {
                Class c;
                switch (peek()) {
                    case '0':
                    case '1':
                    case '2':
                    case '3':
                    case '4':
                    case '5':
                    case '6':
                    case '7':
                    case '8':
                    case '9':
                        c = DIGIT;
                        break;
                    case '.':
                        c = DOT;
                        break;
                    case 'e':
                    case 'E':
                        c = E;
                        break;
                    case '+':
                    case '-':
                        c = PM;
                        break;
                    default:
                        c = OTHER;
                }
                const auto next = TRANSITIONS[state][c];
                if (next == END) {
                    break;
                } else if (next == ERROR) {
                    return make_error("malformed number");
                }
                get();
                state = next;
            }
            m_value.text = Slice {begin, static_cast<Size>(m_itr - begin)};
            return TOKEN_NUMBER;
        }

        auto scan_literal(const char *literal, Token token) -> Token
        {
            TESSERA_EXPECT_EQ(m_char, literal[0]);
            for (const auto *p = literal + 1; *p; ++p) {
                if (get() != *p) {
                    return make_error("invalid literal");
                }
            }
            return token;
        }

        Position m_pos;
        std::string m_scratch;
        LexerValue m_value;
        const char *m_message {};
        const char *m_end {};
        const char *m_itr {};
        char m_char {};
    };

    class Parser {
    public:
        // This parser is a simple state machine with states defined by this enumerator. Nested structure types are
        // tracked using a bit vector.
        enum State {
            STATE_END,
            STATE_STOP,
            STATE_ERROR,
            STATE_BEGIN,
            AB, // Array begin
            A1, // Array element
            AX, // Array element separator
            AE, // Array end
            OB, // Object begin
            O1, // Object key
            OX, // Object key separator
            O2, // Object value
            OY, // Object value separator
            OE, // Object end
            V1, // Freestanding value
            STATE_COUNT,
        };

        explicit Parser(const Slice &input)
            : m_lex {input}
        {}

        auto parse(Handler &handler) -> Status
        {
            Token token {};
            State src {STATE_BEGIN};
            while (m_status.is_ok()) {
                if (!m_lex.scan(token)) {
                    if (token == TOKEN_ERROR) {
                        corruption(m_lex.message());
                    }
                    break;
                }
                src = transit(token, predict(src, token), handler);
                if (src == STATE_STOP) {
                    return m_status;
                }
            }
            return finish(src);
        }

    private:
        auto corruption(const char *message) -> State
        {
            TESSERA_EXPECT_TRUE(m_status.is_ok());
            const auto [line, column] = m_lex.position();
            m_status = Status::corruption(fmt::format("corruption detected at {}:{} ({})", line, column, message));
            return STATE_ERROR;
        }

        auto finish(State state) -> Status
        {
            if (!m_status.is_ok()) {
                return m_status;
            }
            if (!m_stack.empty()) {
                corruption("structure was not closed");
            } else if (state != STATE_END && state != V1) {
                corruption("incomplete or missing structure");
            }
            return m_status;
        }

        // Predict the next state based on the current state and a token read by the lexer. States marked "push"
        // enter a nested structure, and states marked "pop" leave one. All "pop" states are sinks: transit() uses
        // the stack to decide whether the parser moves into A1 or O2 afterward.
        [[nodiscard]] static auto predict(State src, Token token) -> State
        {
            static constexpr State TRANSITIONS[STATE_COUNT][TOKEN_COUNT] = {
#define ex_ STATE_ERROR
                // Token = "s"  123  T/F  nul   {    }    [    ]    :    ,   err
                /* end */ {ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_}, // sink
                /* stp */ {ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_}, // sink
                /* ex_ */ {ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_}, // sink
                /* beg */ {V1, V1, V1, V1, OB, ex_, AB, ex_, ex_, ex_, ex_},       // source
                /*  AB */ {A1, A1, A1, A1, OB, ex_, AB, AE, ex_, ex_, ex_},        // push
                /*  A1 */ {ex_, ex_, ex_, ex_, ex_, ex_, ex_, AE, ex_, AX, ex_},
                /*  AX */ {A1, A1, A1, A1, OB, ex_, AB, ex_, ex_, ex_, ex_},
                /*  AE */ {ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_}, // pop
                /*  OB */ {O1, ex_, ex_, ex_, ex_, OE, ex_, ex_, ex_, ex_, ex_},   // push
                /*  O1 */ {ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, OX, ex_, ex_},
                /*  OX */ {O2, O2, O2, O2, OB, ex_, AB, ex_, ex_, ex_, ex_},
                /*  O2 */ {ex_, ex_, ex_, ex_, ex_, OE, ex_, ex_, ex_, OY, ex_},
                /*  OY */ {O1, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_},
                /*  OE */ {ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_}, // pop
                /*  V1 */ {ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_}, // sink
#undef ex_
            };
            return TRANSITIONS[src][token];
        }

        [[nodiscard]] auto transit(Token token, State dst, Handler &handler) -> State
        {
            static constexpr Size MAXIMUM_DEPTH {10'000};
            auto emit_key = false;

            switch (dst) {
                case V1:
                case A1:
                case O2:
                    // Read a freestanding value, an array element, or an object member value.
                    break;
                case O1:
                    emit_key = true;
                    break;
                case AX:
                case OX:
                case OY:
                    // Separators don't produce an event.
                    return dst;
                case AB:
                case OB:
                    if (m_stack.size() == MAXIMUM_DEPTH) {
                        return corruption("exceeded maximum structure depth");
                    }
                    m_stack.push_back(dst == OB);
                    break;
                case AE:
                case OE:
                    // The stack cannot be empty here: a freestanding value leads to V1, which is a sink.
                    TESSERA_EXPECT_FALSE(m_stack.empty());
                    m_stack.pop_back();
                    if (m_stack.empty()) {
                        dst = STATE_END;
                    } else {
                        dst = m_stack.back() ? O2 : A1;
                    }
                    break;
                case STATE_ERROR:
                    return corruption("unexpected token");
                default:
                    return dst;
            }
            TESSERA_EXPECT_TRUE(emit_key || token < TOKEN_NAME_SEPARATOR);
            const auto event = emit_key ? EVENT_KEY : static_cast<Event>(token);
            if (!dispatch(handler, event, m_lex.value())) {
                return STATE_STOP;
            }
            return dst;
        }

        static auto dispatch(Handler &handler, Event event, const LexerValue &value) -> bool
        {
            switch (event) {
                case EVENT_KEY:
                    return handler.accept_key(value.text);
                case EVENT_STRING:
                    return handler.accept_string(value.text);
                case EVENT_NUMBER:
                    return handler.accept_number(value.text);
                case EVENT_BOOLEAN:
                    return handler.accept_boolean(value.boolean);
                case EVENT_NULL:
                    return handler.accept_null();
                case EVENT_BEGIN_OBJECT:
                    return handler.begin_object();
                case EVENT_END_OBJECT:
                    return handler.end_object();
                case EVENT_BEGIN_ARRAY:
                    return handler.begin_array();
                default:
                    return handler.end_array();
            }
        }

        Status m_status {Status::ok()};
        std::vector<bool> m_stack;
        Lexer m_lex;
    };

} // namespace

auto Reader::read(const Slice &input) -> Status
{
    return Parser {input}.parse(*m_handler);
}

} // namespace Tessera::Json

#pragma once

#define OVERLOAD_4(_1, _2, _3, _4, NAME, ...) NAME

#define CHAIN_VAR_0(TYPE, NAME, DEFAULT_VALUE, SETTER) \
  TYPE NAME = DEFAULT_VALUE;                           \
                                                       \
 public:                                               \
  inline auto &SETTER(const TYPE &NAME) noexcept {     \
    this->NAME = NAME;                                 \
    return *this;                                      \
  }                                                    \
                                                       \
 private:
#define CHAIN_VAR_1(TYPE, NAME, SETTER)            \
  TYPE NAME;                                       \
                                                   \
 public:                                           \
  inline auto &SETTER(const TYPE &NAME) noexcept { \
    this->NAME = NAME;                             \
    return *this;                                  \
  }                                                \
                                                   \
 private:
#define CHAIN_VAR(...) \
  OVERLOAD_4(__VA_ARGS__, CHAIN_VAR_0, CHAIN_VAR_1)(__VA_ARGS__)

#define DEF_EXCEPTION(NAME, ARGS, MSG)                                  \
  class NAME : public std::exception {                                  \
   private:                                                             \
    std::string msg;                                                    \
                                                                        \
   public:                                                              \
    NAME ARGS : msg(MSG) {}                                             \
                                                                        \
   public:                                                              \
    const char *what() const noexcept override { return msg.c_str(); }; \
  };

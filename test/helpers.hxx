#if !defined(PQNEST_H_TEST_HELPERS)
#  define PQNEST_H_TEST_HELPERS

#  include <map>
#  include <stdexcept>
#  include <string>
#  include <string_view>
#  include <type_traits>

#  include <pqnest/except.hxx>
#  include <pqnest/zview.hxx>

namespace pqnest::test
{
/// Exception: A test does not satisfy expected condition.
class test_failure : public std::logic_error
{
public:
  test_failure(std::string const &desc, char const file[], int line);
  ~test_failure() noexcept override;

  char const *file() const noexcept { return m_file; }
  int line() const noexcept { return m_line; }

private:
  char const *m_file;
  int m_line;
};


/// For use by tests that need to simulate an exception.
struct deliberate_error : std::runtime_error
{
  deliberate_error() : std::runtime_error{"Deliberate error."} {}
};


using testfunc = void (*)();


/// All registered tests, by name.
std::map<std::string_view, testfunc> &all_tests();


/// Register a test function.
void register_test(char const name[], testfunc func);


/// Register a test while not inside a function.
struct registrar
{
  registrar(char const name[], testfunc func)
  {
    pqnest::test::register_test(name, func);
  }
};


// Register a test function, so the runner will run it.
#  define PQNEST_REGISTER_TEST(func)                                          \
    [[maybe_unused]] pqnest::test::registrar const tst_##func                 \
    {                                                                         \
      #func, func                                                             \
    }


/// Render a value for a failure message.
template<typename T> inline std::string to_string(T const &value)
{
  if constexpr (std::is_same_v<T, bool>)
    return value ? "true" : "false";
  else if constexpr (std::is_arithmetic_v<T>)
    return std::to_string(value);
  else
    return std::string{std::string_view{value}};
}


// Unconditional test failure.
[[noreturn]] void
check_notreached(std::string const &desc, char const file[], int line);

#  define PQNEST_CHECK_NOTREACHED(desc)                                       \
    pqnest::test::check_notreached((desc), __FILE__, __LINE__)

// Verify that a condition is met, similar to assert().
#  define PQNEST_CHECK(condition, desc)                                       \
    pqnest::test::check((condition), #condition, (desc), __FILE__, __LINE__)
void check(
  bool condition, char const text[], std::string const &desc,
  char const file[], int line);

// Verify that variable has the expected value.
#  define PQNEST_CHECK_EQUAL(actual, expected, desc)                          \
    pqnest::test::check_equal(                                                \
      (actual), #actual, (expected), #expected, (desc), __FILE__, __LINE__)
template<typename ACTUAL, typename EXPECTED>
inline void check_equal(
  ACTUAL const &actual, char const actual_text[], EXPECTED const &expected,
  char const expected_text[], std::string const &desc, char const file[],
  int line)
{
  if (expected == actual)
    return;
  std::string const fulldesc = desc + " (" + actual_text + " <> " +
                               expected_text +
                               ": "
                               "actual=" +
                               to_string(actual) +
                               ", "
                               "expected=" +
                               to_string(expected) + ")";
  throw test_failure{fulldesc, file, line};
}

// Verify that two values are not equal.
#  define PQNEST_CHECK_NOT_EQUAL(value1, value2, desc)                        \
    pqnest::test::check_not_equal(                                            \
      (value1), #value1, (value2), #value2, (desc), __FILE__, __LINE__)
template<typename VALUE1, typename VALUE2>
inline void check_not_equal(
  VALUE1 const &value1, char const text1[], VALUE2 const &value2,
  char const text2[], std::string const &desc, char const file[], int line)
{
  if (value1 != value2)
    return;
  std::string const fulldesc = desc + " (" + text1 + " == " + text2 +
                               ": "
                               "both are " +
                               to_string(value2) + ")";
  throw test_failure{fulldesc, file, line};
}


// Verify that value1 is less than value2.
#  define PQNEST_CHECK_LESS(value1, value2, desc)                             \
    pqnest::test::check_less(                                                 \
      (value1), #value1, (value2), #value2, (desc), __FILE__, __LINE__)
template<typename VALUE1, typename VALUE2>
inline void check_less(
  VALUE1 const &value1, char const text1[], VALUE2 const &value2,
  char const text2[], std::string const &desc, char const file[], int line)
{
  if (value1 < value2)
    return;
  std::string const fulldesc = desc + " (" + text1 + " >= " + text2 +
                               ": "
                               "\"lower\"=" +
                               to_string(value1) +
                               ", "
                               "\"upper\"=" +
                               to_string(value2) + ")";
  throw test_failure{fulldesc, file, line};
}


struct failure_to_fail
{};


namespace internal
{
/// Syntactic placeholder: require (and accept) semicolon after block.
inline void end_of_statement() {}
} // namespace internal


// Verify that "action" does not throw an exception.
#  define PQNEST_CHECK_SUCCEEDS(action, desc)                                 \
    {                                                                         \
      try                                                                     \
      {                                                                       \
        action;                                                               \
      }                                                                       \
      catch (std::exception const &e)                                         \
      {                                                                       \
        PQNEST_CHECK_NOTREACHED(                                              \
          std::string{desc} + " - \"" #action "\" threw exception: " +        \
          e.what());                                                          \
      }                                                                       \
      catch (...)                                                             \
      {                                                                       \
        PQNEST_CHECK_NOTREACHED(                                              \
          std::string{desc} + " - \"" #action "\" threw a non-exception!");   \
      }                                                                       \
    }                                                                         \
    pqnest::test::internal::end_of_statement()

// Verify that "action" throws "exception_type".
#  define PQNEST_CHECK_THROWS(action, exception_type, desc)                   \
    {                                                                         \
      try                                                                     \
      {                                                                       \
        action;                                                               \
        throw pqnest::test::failure_to_fail();                                \
      }                                                                       \
      catch (pqnest::test::failure_to_fail const &)                           \
      {                                                                       \
        PQNEST_CHECK_NOTREACHED(                                              \
          std::string{desc} + " (\"" #action                                  \
                              "\" did not throw " #exception_type ")");       \
      }                                                                       \
      catch (exception_type const &)                                          \
      {}                                                                      \
      catch (std::exception const &e)                                         \
      {                                                                       \
        PQNEST_CHECK_NOTREACHED(                                              \
          std::string{desc} +                                                 \
          " (\"" #action                                                      \
          "\" "                                                               \
          "threw exception other than " #exception_type ": " +                \
          e.what() + ")");                                                    \
      }                                                                       \
      catch (...)                                                             \
      {                                                                       \
        PQNEST_CHECK_NOTREACHED(                                              \
          std::string{desc} + " (\"" #action "\" threw non-exception type)"); \
      }                                                                       \
    }                                                                         \
    pqnest::test::internal::end_of_statement()


// Report expected exception.
void expected_exception(std::string const &);
} // namespace pqnest::test
#endif

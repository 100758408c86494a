#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace alerter
{

  class Marshaler;
  class Value;
  struct Field;

  /**
   * Ordered list of key/value pairs.
   *
   * Used both for the context attached to a sink and for the pairs passed at
   * a call site. Insertion order and duplicate keys are preserved.
   */
  class Fields
  {
  public:
    Fields() = default;
    Fields(std::initializer_list<Field> fields);

    /**
     * Append a single pair.
     * @param key Field key.
     * @param value Field value.
     */
    void add(std::string key, Value value);

    /**
     * Append every pair of another list, after the existing ones.
     * @param other Pairs to append.
     */
    void append(const Fields &other);

    // True when no fields were added.
    [[nodiscard]] bool empty() const;
    [[nodiscard]] std::size_t size() const;
    // Access raw entries for serialization.
    [[nodiscard]] const std::vector<Field> &entries() const;

    friend bool operator==(const Fields &lhs, const Fields &rhs);

  private:
    std::vector<Field> fields_;
  };

  /**
   * A single alerted value.
   *
   * Nested objects are carried as Fields. Values implementing Marshaler are
   * held by shared pointer and substituted by the sink at render time.
   */
  class Value
  {
  public:
    using Storage = std::variant<std::nullptr_t,
                                 bool,
                                 std::int64_t,
                                 std::uint64_t,
                                 double,
                                 std::string,
                                 std::vector<std::string>,
                                 Fields,
                                 std::shared_ptr<const Marshaler>>;

    Value() noexcept : data_() {}
    Value(std::nullptr_t) noexcept : data_(std::in_place_type<std::nullptr_t>, nullptr) {}
    Value(bool value) : data_(value) {}

    template <std::signed_integral T>
    Value(T value) : data_(static_cast<std::int64_t>(value))
    {
    }

    template <std::unsigned_integral T>
      requires(!std::same_as<T, bool>)
    Value(T value) : data_(static_cast<std::uint64_t>(value))
    {
    }

    // Every floating point type is stored as double.
    template <std::floating_point T>
    Value(T value) : data_(static_cast<double>(value))
    {
    }

    // A null C string is stored as null.
    Value(const char *value)
        : data_(value ? Storage(std::string(value)) : Storage(std::in_place_type<std::nullptr_t>, nullptr))
    {
    }
    Value(std::string value) : data_(std::move(value)) {}
    Value(std::string_view value) : data_(std::string(value)) {}
    Value(std::vector<std::string> values) : data_(std::move(values)) {}
    Value(Fields object) : data_(std::move(object)) {}
    Value(std::shared_ptr<const Marshaler> marshaler) : data_(std::move(marshaler)) {}

    // Copies a Marshaler implementation into shared storage.
    template <typename T>
      requires std::derived_from<std::remove_cvref_t<T>, Marshaler>
    Value(T &&marshaler)
        : data_(std::shared_ptr<const Marshaler>(
              std::make_shared<const std::remove_cvref_t<T>>(std::forward<T>(marshaler))))
    {
    }

    [[nodiscard]] bool is_null() const { return std::holds_alternative<std::nullptr_t>(data_); }

    /**
     * Return a pointer to the held alternative, or nullptr on type mismatch.
     * @tparam T One of the Storage alternatives.
     * @return Pointer into this value.
     */
    template <typename T>
    [[nodiscard]] const T *get_if() const
    {
      return std::get_if<T>(&data_);
    }

    /**
     * Invoke a visitor with the held alternative.
     * @param visitor Callable accepting every Storage alternative.
     * @return Whatever the visitor returns.
     */
    template <typename Visitor>
    decltype(auto) visit(Visitor &&visitor) const
    {
      return std::visit(std::forward<Visitor>(visitor), data_);
    }

    friend bool operator==(const Value &lhs, const Value &rhs) { return lhs.data_ == rhs.data_; }

  private:
    Storage data_;
  };

  // Single key/value field.
  struct Field
  {
    std::string key;
    Value value;

    friend bool operator==(const Field &lhs, const Field &rhs)
    {
      return lhs.key == rhs.key && lhs.value == rhs.value;
    }
  };

  inline Fields::Fields(std::initializer_list<Field> fields) : fields_(fields) {}

  inline void Fields::add(std::string key, Value value)
  {
    fields_.push_back(Field{std::move(key), std::move(value)});
  }

  inline void Fields::append(const Fields &other)
  {
    fields_.insert(fields_.end(), other.fields_.begin(), other.fields_.end());
  }

  inline bool Fields::empty() const { return fields_.empty(); }

  inline std::size_t Fields::size() const { return fields_.size(); }

  inline const std::vector<Field> &Fields::entries() const { return fields_; }

  inline bool operator==(const Fields &lhs, const Fields &rhs) { return lhs.fields_ == rhs.fields_; }

} // namespace alerter

// Marshaller.hpp
// Host value <-> foreign call slot conversion, driven by decoded type descriptors
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Utilities/StringInterner.hpp>

#include <ObjBridge/Encoding.hpp>
#include <ObjBridge/Export.hpp>
#include <ObjBridge/Ownership.hpp>
#include <ObjBridge/Proxy.hpp>
#include <ObjBridge/Types.hpp>

#include <array>
#include <cstddef>
#include <cstring>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string_view>
#include <vector>

namespace ObjBridge
{
  class Bridge;

  // Aligned storage for one foreign value plus whatever host-side memory the
  // value points into (C strings, pointees, boxed objects). Moving a slot keeps
  // every pointer written into it valid.
  class OBJBRIDGE_API ForeignSlot
  {
  public:
    ForeignSlot() = default;
    explicit ForeignSlot(NGIN::UIntSize size)
        : m_words((size + sizeof(std::max_align_t) - 1) / sizeof(std::max_align_t)), m_size(size)
    {
    }

    [[nodiscard]] void *Data() noexcept { return m_words.data(); }
    [[nodiscard]] const void *Data() const noexcept { return m_words.data(); }
    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_size; }

    template <class T>
    [[nodiscard]] T Load() const noexcept
    {
      T v;
      std::memcpy(&v, Data(), sizeof(T));
      return v;
    }

    template <class T>
    void Store(const T &v) noexcept
    {
      std::memcpy(Data(), &v, sizeof(T));
    }

    void KeepAlive(std::shared_ptr<const void> storage) { m_keepAlive.push_back(std::move(storage)); }

    // Pointee of an out/inout pointer, copied back into `param` after the call.
    struct WriteBack
    {
      OutParam param;
      std::shared_ptr<ForeignSlot> pointee;
      TypeDescriptor type;
    };

    void AddWriteBack(WriteBack entry) { m_writeBacks.push_back(std::move(entry)); }
    [[nodiscard]] const std::vector<WriteBack> &WriteBacks() const noexcept { return m_writeBacks; }

  private:
    std::vector<std::max_align_t> m_words;
    NGIN::UIntSize m_size{0};
    std::vector<std::shared_ptr<const void>> m_keepAlive;
    std::vector<WriteBack> m_writeBacks;
  };

  // Converts a host value into a foreign object. Registered per host type id.
  using BoxingAdapter = std::function<Expected<ProxyHandle>(Bridge &, const Any &)>;

  // Host kinds accepted per TypeKind:
  //   Bool/Integer/Float  any arithmetic value, range-checked against the slot
  //   CString             std::string, const char *, nullptr
  //   Object/Class/Block  ProxyHandle, nullptr, or a value with a boxing adapter
  //   Selector            Selector, std::string, nullptr
  //   Struct/Union        Aggregate
  //   Array               std::vector<Any> of the declared length
  //   Pointer             nullptr, void *, OutParam
  //   Unknown             Blob no larger than a pointer
  //
  // Foreign values come back as bool, std::int64_t/std::uint64_t, float/double/
  // long double, std::string, ProxyHandle, Selector, Aggregate, std::vector<Any>,
  // void *, Blob, or std::nullptr_t for null references. Union members are read
  // without following references: pointer-like members come back as void *.
  class OBJBRIDGE_API ValueMarshaller
  {
  public:
    explicit ValueMarshaller(Bridge &bridge);

    ValueMarshaller(const ValueMarshaller &) = delete;
    ValueMarshaller &operator=(const ValueMarshaller &) = delete;

    // Call-argument form. Top-level arrays decay to a pointer to their elements.
    [[nodiscard]] Expected<ForeignSlot> ToForeign(const Any &host, const TypeDescriptor &type);
    [[nodiscard]] Expected<Any> ToHost(const ForeignSlot &slot, const TypeDescriptor &type, Ownership ownership = Ownership::Borrowed);

    // In-place forms used for nested values and instance variables.
    [[nodiscard]] Expected<void> WriteValue(const Any &host, const TypeDescriptor &type, std::byte *dst, ForeignSlot &owner);
    [[nodiscard]] Expected<Any> ReadValue(const std::byte *src, const TypeDescriptor &type, Ownership ownership);

    // Copies every out/inout pointee of `slot` back into its OutParam.
    [[nodiscard]] Expected<void> ApplyWriteBacks(const ForeignSlot &slot);

    // Descriptor a value takes in a variadic tail after default argument promotion.
    [[nodiscard]] static Expected<TypeDescriptor> PromotedType(const Any &host);

    template <class T>
    void RegisterBoxing(BoxingAdapter adapter)
    {
      RegisterBoxing(detail::TypeIdOf<T>(), std::move(adapter));
    }
    void RegisterBoxing(NGIN::UInt64 typeId, BoxingAdapter adapter);
    [[nodiscard]] bool HasBoxing(NGIN::UInt64 typeId) const;
    [[nodiscard]] Expected<ProxyHandle> Box(const Any &host);

    void SetAutoBoxing(bool enabled) noexcept { m_autoBoxing = enabled; }
    [[nodiscard]] bool AutoBoxing() const noexcept { return m_autoBoxing; }

    // Runtime selector handle, cached per unique name.
    [[nodiscard]] SelectorId SelectorFor(std::string_view name);

    [[nodiscard]] Bridge &Owner() noexcept { return *m_bridge; }

  private:
    using WriteFn = Expected<void> (*)(ValueMarshaller &, const Any &, const TypeDescriptor &, std::byte *, ForeignSlot &);
    using ReadFn = Expected<Any> (*)(ValueMarshaller &, const std::byte *, const TypeDescriptor &, Ownership);

    struct SlotAdapter
    {
      WriteFn write{nullptr};
      ReadFn read{nullptr};
    };

    static constexpr NGIN::UIntSize kKindCount = static_cast<NGIN::UIntSize>(TypeKind::Unknown) + 1;

    Bridge *m_bridge;
    std::array<SlotAdapter, kKindCount> m_adapters{};
    bool m_autoBoxing{true};

    mutable std::shared_mutex m_boxingMutex;
    mutable NGIN::Containers::FlatHashMap<NGIN::UInt64, BoxingAdapter> m_boxing;

    std::mutex m_selectorMutex;
    NGIN::Utilities::StringInterner<> m_selectorNames;
    NGIN::Containers::FlatHashMap<NameId, SelectorId> m_selectors;
  };

} // namespace ObjBridge

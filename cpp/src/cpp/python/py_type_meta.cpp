#include <dynscope/python/py_value.h>
#include <dynscope/scope/scoped_key.h>

#include <nanobind/stl/string.h>

#include <memory>
#include <mutex>
#include <new>
#include <unordered_map>

namespace dynscope {

    namespace {
        const nb::object &as_object(const void *v) { return *static_cast<const nb::object *>(v); }

        void py_copy_construct(void *dest, const void *src, const TypeMeta *) { new (dest) nb::object(as_object(src)); }

        void py_destruct(void *dest, const TypeMeta *) {
            auto *obj = static_cast<nb::object *>(dest);
            if (!Py_IsInitialized()) {
                // The interpreter is gone, the reference can no longer be released
                (void)obj->release();
                return;
            }
            nb::gil_scoped_acquire guard;
            obj->~object();
        }

        bool py_equals(const void *a, const void *b, const TypeMeta *) {
            nb::gil_scoped_acquire guard;
            return as_object(a).equal(as_object(b));
        }

        size_t py_hash(const void *v, const TypeMeta *) {
            nb::gil_scoped_acquire guard;
            try {
                return static_cast<size_t>(nb::hash(as_object(v)));
            } catch (const nb::python_error &) {
                // Unhashable objects all share a bucket
                return 0;
            }
        }

        std::string py_to_string(const void *v, const TypeMeta *) {
            nb::gil_scoped_acquire guard;
            return nb::cast<std::string>(nb::repr(as_object(v)));
        }

        std::string py_type_name(const TypeMeta *) { return "object"; }

        constexpr TypeOps py_object_ops = {
            .copy_construct = &py_copy_construct,
            .destruct = &py_destruct,
            .equals = &py_equals,
            .hash = &py_hash,
            .to_string = &py_to_string,
            .type_name = &py_type_name,
            .accepts = nullptr,
        };

        const TypeMeta py_object_meta = {
            .size = sizeof(nb::object),
            .alignment = alignof(nb::object),
            .flags = TypeFlags::Hashable | TypeFlags::Equatable,
            .kind = TypeKind::Foreign,
            .ops = &py_object_ops,
            .type_info = &typeid(nb::object),
            .name = "object",
        };

        // A TypeMeta that also holds the Python class it was declared with
        struct PyDeclaredTypeMeta : TypeMeta {
            nb::object py_type;
            std::string type_name;
        };

        bool py_declared_accepts(const TypeMeta *declared, const TypeMeta *actual, const void *v) {
            if (actual != &py_object_meta) { return false; }
            auto *meta = static_cast<const PyDeclaredTypeMeta *>(declared);
            nb::gil_scoped_acquire guard;
            int result = PyObject_IsInstance(as_object(v).ptr(), meta->py_type.ptr());
            if (result < 0) { throw nb::python_error(); }
            return result == 1;
        }

        constexpr TypeOps py_declared_ops = {
            .copy_construct = nullptr,
            .destruct = nullptr,
            .equals = nullptr,
            .hash = nullptr,
            .to_string = nullptr,
            .type_name = nullptr,
            .accepts = &py_declared_accepts,
        };

        struct DeclaredTypeRegistry {
            std::mutex mutex;
            std::unordered_map<PyObject *, std::unique_ptr<PyDeclaredTypeMeta>> metas;
        };

        DeclaredTypeRegistry &declared_types() {
            // Leaked, the metas must outlive every key and the interpreter's own shutdown
            static auto *registry = new DeclaredTypeRegistry();
            return *registry;
        }
    } // namespace

    const TypeMeta *py_object_type_meta() { return &py_object_meta; }

    const TypeMeta *py_declared_type_meta(nb::handle type) {
        if (type.is_none() || type.is(reinterpret_cast<PyObject *>(&PyBaseObject_Type))) { return any_type_meta(); }
        if (!PyType_Check(type.ptr())) {
            throw_error<TypeMismatchError>("A key must be declared with a type, got {}",
                                           nb::cast<std::string>(nb::repr(type)));
        }

        auto &registry = declared_types();
        std::lock_guard<std::mutex> lock(registry.mutex);
        auto &entry = registry.metas[type.ptr()];
        if (!entry) {
            entry = std::make_unique<PyDeclaredTypeMeta>();
            entry->size = 0;
            entry->alignment = 1;
            entry->flags = TypeFlags::None;
            entry->kind = TypeKind::Foreign;
            entry->ops = &py_declared_ops;
            entry->type_info = nullptr;
            entry->py_type = nb::borrow(type);
            entry->type_name = nb::cast<std::string>(type.attr("__qualname__"));
            entry->name = entry->type_name.c_str();
        }
        return entry.get();
    }

    Value to_value(nb::handle obj) {
        nb::object owned = nb::borrow(obj);
        return Value::copy_of(&py_object_meta, &owned);
    }

    nb::object from_value(const Value &value) {
        if (!value.has_value()) { return nb::none(); }
        if (value.schema() == &py_object_meta) { return as_object(value.data()); }
        if (auto v = value.try_as<bool>()) { return nb::cast(*v); }
        if (auto v = value.try_as<int64_t>()) { return nb::cast(*v); }
        if (auto v = value.try_as<int32_t>()) { return nb::cast(*v); }
        if (auto v = value.try_as<double>()) { return nb::cast(*v); }
        if (auto v = value.try_as<std::string>()) { return nb::cast(*v); }
        return nb::cast(value.to_string());
    }

} // namespace dynscope

void export_types(nb::module_ &m) {
    using namespace dynscope;

    nb::enum_<Inheritance>(m, "Inheritance")
        .value("INHERITABLE", Inheritance::INHERITABLE)
        .value("LOCAL", Inheritance::LOCAL);

    nb::class_<ScopedKeyBase>(m, "ScopedKey")
        .def(
            "__init__",
            [](ScopedKeyBase *self, nb::handle type, std::string name, bool inheritable) {
                new (self) ScopedKeyBase(py_declared_type_meta(type), std::move(name),
                                         inheritable ? Inheritance::INHERITABLE : Inheritance::LOCAL);
            },
            "type"_a = nb::none(), "name"_a = "", "inheritable"_a = true)
        .def_prop_ro("id", &ScopedKeyBase::id)
        .def_prop_ro("name", &ScopedKeyBase::name)
        .def_prop_ro("inheritable", &ScopedKeyBase::is_inheritable)
        .def_prop_ro("type_name", [](const ScopedKeyBase &self) { return self.schema()->type_name(); })
        .def("__eq__", [](const ScopedKeyBase &self, const ScopedKeyBase &other) { return self == other; })
        .def("__hash__", [](const ScopedKeyBase &self) { return std::hash<ScopedKeyBase>{}(self); })
        .def("__repr__", &ScopedKeyBase::to_string);
}

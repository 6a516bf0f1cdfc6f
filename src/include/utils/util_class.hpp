#ifndef TODEL_UTIL_CLASS_HEADER
#define TODEL_UTIL_CLASS_HEADER

namespace todel {

// 禁止类对象拷贝的工具类
// 使用方式：class MyType : public Noncopyable {...};
class Noncopyable {
   protected:
    Noncopyable() = default;
    ~Noncopyable() = default;

   public:
    Noncopyable& operator=(const Noncopyable&) = delete;
    Noncopyable(const Noncopyable&) = delete;
};

}  // namespace todel

#endif

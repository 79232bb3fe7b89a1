#include "fakes.h"
#include "huginn/model_provider.h"
#include <gtest/gtest.h>

using namespace huginn;
using namespace huginn::testing;

namespace {

class CountingLoader {
public:
    explicit CountingLoader(FakeSlicer& slicer) : slicer_(slicer) {}

    CachedModelProvider::Loader loader() {
        return [this](const std::string& size) -> std::shared_ptr<TranscriptionEngine> {
            loads.push_back(size);
            if (size == "broken") {
                throw std::runtime_error("cannot load " + size);
            }
            if (size == "null") {
                return nullptr;
            }
            return std::make_shared<FakeEngine>(slicer_, size);
        };
    }

    std::vector<std::string> loads;

private:
    FakeSlicer& slicer_;
};

} // anonymous namespace

TEST(ModelProviderTest, LoadsEachSizeOnce) {
    FakeSlicer slicer;
    CountingLoader counter(slicer);
    CachedModelProvider models(counter.loader());

    auto first = models.get_or_load("base");
    auto second = models.get_or_load("base");
    auto other = models.get_or_load("small");

    EXPECT_EQ(first, second);
    EXPECT_NE(first, other);
    EXPECT_EQ(counter.loads, (std::vector<std::string>{"base", "small"}));
    EXPECT_TRUE(models.is_loaded("base"));
    EXPECT_FALSE(models.is_loaded("tiny"));
    EXPECT_EQ(models.loaded_count(), 2u);
}

TEST(ModelProviderTest, FailedLoadIsNotCached) {
    FakeSlicer slicer;
    CountingLoader counter(slicer);
    CachedModelProvider models(counter.loader());

    EXPECT_THROW(models.get_or_load("broken"), std::runtime_error);
    EXPECT_THROW(models.get_or_load("broken"), std::runtime_error);
    EXPECT_EQ(counter.loads.size(), 2u);
    EXPECT_EQ(models.loaded_count(), 0u);
}

TEST(ModelProviderTest, NullEngineIsAnError) {
    FakeSlicer slicer;
    CountingLoader counter(slicer);
    CachedModelProvider models(counter.loader());

    EXPECT_THROW(models.get_or_load("null"), std::runtime_error);
    EXPECT_FALSE(models.is_loaded("null"));
}

TEST(ModelProviderTest, ClearDropsCacheButKeepsHandedOutEngines) {
    FakeSlicer slicer;
    CountingLoader counter(slicer);
    CachedModelProvider models(counter.loader());

    auto engine = models.get_or_load("base");
    models.clear();

    EXPECT_EQ(models.loaded_count(), 0u);
    EXPECT_EQ(engine.use_count(), 1);

    auto reloaded = models.get_or_load("base");
    EXPECT_NE(engine, reloaded);
    EXPECT_EQ(counter.loads.size(), 2u);
}

TEST(ModelProviderTest, RequiresLoader) {
    EXPECT_THROW(CachedModelProvider(nullptr), std::invalid_argument);
}

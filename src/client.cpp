#include <utility>

#include <featureprobe/client.hpp>
#include <featureprobe/logging.hpp>

#include "evaluate.hpp"
#include "event_recorder.hpp"
#include "polling.hpp"
#include "store.hpp"
#include "synchronizer.hpp"
#include "utility.hpp"

namespace fp {

static const char *const TYPE_MISMATCH = "Value type mismatch";

Client::Client(
    Config config,
    std::shared_ptr<Store> store,
    std::unique_ptr<Synchronizer> synchronizer,
    std::unique_ptr<EventRecorder> recorder)
    : m_config{std::move(config)},
      m_store{std::move(store)},
      m_synchronizer{std::move(synchronizer)},
      m_recorder{std::move(recorder)}
{}

Client::~Client()
{
    close();
}

ClientOrError
Client::init(Config config)
{
    if (const std::optional<Error> error = config.validate()) {
        FP_LOG(LogLevel::Error, "invalid configuration: %s", error->msg.c_str());
        return *error;
    }

    std::shared_ptr<HttpClient> httpClient = config.httpClient();
    if (!httpClient) {
        httpClient = makeCurlHttpClient();
    }

    std::shared_ptr<DataSource> dataSource = config.dataSource();
    if (!dataSource) {
        dataSource = std::make_shared<PollingDataSource>(
            config.togglesUrl(), config.serverSdkKey(), config.refreshInterval(), httpClient);
    }

    auto store = std::make_shared<Store>();

    auto recorder = std::make_unique<EventRecorder>(
        config.eventsUrl(), config.serverSdkKey(), config.refreshInterval(), httpClient);
    recorder->start();

    auto synchronizer = std::make_unique<Synchronizer>(dataSource, store, config.refreshInterval());
    synchronizer->start(config.waitFirstResp(), config.startWait());

    return std::unique_ptr<Client>(
        new Client(std::move(config), std::move(store), std::move(synchronizer), std::move(recorder)));
}

std::unique_ptr<Client>
Client::forTest(const std::map<std::string, Value> &toggles)
{
    Repository repository;

    for (const auto &entry : toggles) {
        Toggle toggle;
        toggle.key = entry.first;
        toggle.enabled = true;
        toggle.defaultServe.select = 0;
        toggle.disabledServe.select = 0;
        toggle.variations.push_back(entry.second);
        repository.toggles.emplace(entry.first, std::move(toggle));
    }

    auto store = std::make_shared<Store>();
    store->publish(std::move(repository));

    return std::unique_ptr<Client>(new Client(Config("", ""), std::move(store), nullptr, nullptr));
}

EvalDetail
Client::genericDetail(const std::string &toggle, const User &user, const Value &defaultValue)
{
    EvalDetail detail;
    detail.reason = "Toggle:[" + toggle + "] not exist";

    const std::shared_ptr<const Repository> repository = m_store->snapshot();
    const auto found = repository->toggles.find(toggle);

    if (found != repository->toggles.end()) {
        detail = evaluate(found->second, user, repository->segments);
    }

    if (m_recorder) {
        AccessEvent event;
        event.time = getUnixMilliseconds();
        event.key = toggle;
        event.value = detail.value ? *detail.value : defaultValue;
        event.index = detail.variationIndex;
        event.version = detail.version;
        event.reason = detail.reason;
        m_recorder->record(std::move(event));
    }

    return detail;
}

template <typename T, typename Convert>
static Detail<T>
typedDetail(EvalDetail detail, const T &defaultValue, Convert convert)
{
    Detail<T> result{defaultValue, detail.ruleIndex, detail.version, std::move(detail.reason)};

    if (!detail.value) {
        return result;
    }

    std::optional<T> converted = convert(*detail.value);
    if (!converted) {
        result.reason = TYPE_MISMATCH;
        return result;
    }

    result.value = std::move(*converted);
    return result;
}

BoolDetail
Client::boolDetail(const std::string &toggle, const User &user, const bool defaultValue)
{
    return typedDetail<bool>(genericDetail(toggle, user, Value(defaultValue)), defaultValue,
        [](const Value &value) { return value.asBool(); });
}

StringDetail
Client::stringDetail(const std::string &toggle, const User &user, const std::string &defaultValue)
{
    return typedDetail<std::string>(genericDetail(toggle, user, Value(defaultValue)), defaultValue,
        [](const Value &value) { return value.asString(); });
}

NumberDetail
Client::numberDetail(const std::string &toggle, const User &user, const double defaultValue)
{
    return typedDetail<double>(genericDetail(toggle, user, Value(defaultValue)), defaultValue,
        [](const Value &value) { return value.asNumber(); });
}

JsonDetail
Client::jsonDetail(const std::string &toggle, const User &user, const nlohmann::json &defaultValue)
{
    return typedDetail<nlohmann::json>(genericDetail(toggle, user, Value(defaultValue)), defaultValue,
        [](const Value &value) { return std::optional<nlohmann::json>(value.toJson()); });
}

bool
Client::boolValue(const std::string &toggle, const User &user, const bool defaultValue)
{
    return boolDetail(toggle, user, defaultValue).value;
}

std::string
Client::stringValue(const std::string &toggle, const User &user, const std::string &defaultValue)
{
    return stringDetail(toggle, user, defaultValue).value;
}

double
Client::numberValue(const std::string &toggle, const User &user, const double defaultValue)
{
    return numberDetail(toggle, user, defaultValue).value;
}

nlohmann::json
Client::jsonValue(const std::string &toggle, const User &user, const nlohmann::json &defaultValue)
{
    return jsonDetail(toggle, user, defaultValue).value;
}

bool
Client::initialized() const
{
    return m_store->initialized();
}

void
Client::close()
{
    if (m_synchronizer) {
        m_synchronizer->stop();
    }

    m_store->clear();

    if (m_recorder) {
        m_recorder->stop();
    }
}

const Config &
Client::config() const
{
    return m_config;
}

} // namespace fp

// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

#include "describe.h"

#include <stdio.h>      // for sprintf
#include <math.h>       // for fabs

static const char* descriptors[] = { "elegant", "complex", "simple", "intricate", "balanced" };

static const char* stablenames[] = { "Stable", "Steady", "Balanced" };
static const char* clusternouns[] = { "Colony", "Cluster", "Formation" };
static const char* complexnames[] = { "Complex", "Diverse", "Multi" };
static const char* complexnouns[] = { "System", "Network", "Assembly" };
static const char* chaoticnames[] = { "Chaotic", "Random", "Turbulent" };
static const char* chaoticnouns[] = { "Field", "Storm", "Flux" };
static const char* changingnames[] = { "Transitional", "Evolving", "Dynamic" };
static const char* changingnouns[] = { "Pattern", "Structure", "Form" };

#define POOLSIZE(pool) (int)(sizeof(pool) / sizeof(pool[0]))

// -----------------------------------------------------------------------------

static const char* pick(const char** pool, int count, liferandom& rnd)
{
    std::uniform_int_distribution<int> dist(0, count - 1);
    return pool[dist(rnd)];
}

// -----------------------------------------------------------------------------

behavior classifybehavior(const patternmetrics& metrics)
{
    if (metrics.stability > 0.8) return STABLE_BEHAVIOR;
    if (fabs(metrics.growth) > 0.3)
        return metrics.growth > 0 ? GROWING_BEHAVIOR : DECLINING_BEHAVIOR;
    if (metrics.diversity > 0.6) return COMPLEX_BEHAVIOR;
    if (metrics.entropy > 0.7) return CHAOTIC_BEHAVIOR;
    return TRANSITIONAL_BEHAVIOR;
}

// -----------------------------------------------------------------------------

const char* behaviorlabel(behavior b)
{
    switch (b) {
        case STABLE_BEHAVIOR:       return "stable";
        case GROWING_BEHAVIOR:      return "growing";
        case DECLINING_BEHAVIOR:    return "declining";
        case COMPLEX_BEHAVIOR:      return "complex";
        case CHAOTIC_BEHAVIOR:      return "chaotic";
        case TRANSITIONAL_BEHAVIOR: return "transitional";
    }
    return "unknown";
}

// -----------------------------------------------------------------------------

bool describepattern(const patternmetrics& metrics, int generation,
                     liferandom& rnd, patterndescription& desc)
{
    if (generation < MINDESCRIBEGEN) return false;

    char text[512];
    char name[64];
    behavior category = classifybehavior(metrics);
    const char* adjective = pick(descriptors, POOLSIZE(descriptors), rnd);

    switch (category) {
        case STABLE_BEHAVIOR:
            sprintf(text,
                "This %s pattern has achieved remarkable stability with %.0f%% consistency. "
                "The configuration maintains its structure across generations, "
                "suggesting a well-balanced ecosystem.",
                adjective, metrics.stability * 100);
            sprintf(name, "%s Formation", pick(stablenames, POOLSIZE(stablenames), rnd));
            break;

        case GROWING_BEHAVIOR:
        case DECLINING_BEHAVIOR: {
            bool growing = category == GROWING_BEHAVIOR;
            sprintf(text,
                "An %s pattern showing %s behavior. Population %s by approximately "
                "%.1f%% per generation, indicating %s conditions.",
                adjective, growing ? "expansion" : "contraction",
                growing ? "increases" : "decreases", fabs(metrics.growth * 100),
                growing ? "favorable" : "challenging");
            sprintf(name, "%s %s", growing ? "Expanding" : "Contracting",
                    pick(clusternouns, POOLSIZE(clusternouns), rnd));
            break;
        }

        case COMPLEX_BEHAVIOR: {
            sprintf(text,
                "A highly %s pattern with %.0f%% structural diversity. Multiple distinct "
                "clusters interact dynamically, creating emergent behaviors typical of "
                "complex adaptive systems.",
                adjective, metrics.diversity * 100);
            const char* first = pick(complexnames, POOLSIZE(complexnames), rnd);
            sprintf(name, "%s %s", first, pick(complexnouns, POOLSIZE(complexnouns), rnd));
            break;
        }

        case CHAOTIC_BEHAVIOR: {
            sprintf(text,
                "A %s chaotic pattern with high entropy (%.2f). The unpredictable evolution "
                "suggests sensitivity to initial conditions, a hallmark of deterministic chaos.",
                adjective, metrics.entropy);
            const char* first = pick(chaoticnames, POOLSIZE(chaoticnames), rnd);
            sprintf(name, "%s %s", first, pick(chaoticnouns, POOLSIZE(chaoticnouns), rnd));
            break;
        }

        default: {
            sprintf(text,
                "A %s pattern in transition. With moderate stability and growth rates, "
                "this configuration represents the dynamic equilibrium often seen in "
                "evolving systems.",
                adjective);
            const char* first = pick(changingnames, POOLSIZE(changingnames), rnd);
            sprintf(name, "%s %s", first, pick(changingnouns, POOLSIZE(changingnouns), rnd));
            break;
        }
    }

    desc.category = category;
    desc.name = name;
    desc.text = text;
    return true;
}
